/**
 * Tests for the Combatant Model
 */

#include "combatant.hpp"

// ============================================================================
// STAT SCALING
// ============================================================================

TEST(Combatant, ScaleStat) {
    TEST_ASSERT_EQ(60, scale_stat(55));
    TEST_ASSERT_EQ(114, scale_stat(109));
    TEST_ASSERT_EQ(5, scale_stat(0));
}

TEST(Combatant, ScaleHpBase35Is90) {
    TEST_ASSERT_EQ(90, scale_hp(35));
}

TEST(Combatant, DerivePikachu) {
    Combatant pikachu = make_combatant("pikachu", {ElementType::ELECTRIC},
                                       {35, 55, 40, 50, 50, 90});
    TEST_ASSERT_EQ(90, pikachu.max_hp());
    TEST_ASSERT_EQ(90, pikachu.current_hp);
    TEST_ASSERT_EQ(60, pikachu.stats.attack);
    TEST_ASSERT_EQ(45, pikachu.stats.defense);
    TEST_ASSERT_EQ(55, pikachu.stats.special_attack);
    TEST_ASSERT_EQ(55, pikachu.stats.special_defense);
    TEST_ASSERT_EQ(95, pikachu.stats.speed);
    TEST_ASSERT_FALSE(pikachu.has_status());
    TEST_ASSERT_TRUE(pikachu.status_kind() == StatusKind::NONE);
}

TEST(Combatant, MovesTruncatedToFour) {
    std::vector<MoveDef> moves;
    for (int i = 0; i < 6; i++) {
        moves.push_back(make_move("move-" + std::to_string(i), ElementType::NORMAL,
                                  MoveCategory::PHYSICAL, 40));
    }
    Combatant c = make_combatant("mew", {ElementType::PSYCHIC}, {100, 100, 100, 100, 100, 100}, moves);
    TEST_ASSERT_EQ(4u, c.moves.size());
    TEST_ASSERT_EQ(std::string("move-0"), c.moves.front().name);
    TEST_ASSERT_EQ(std::string("move-3"), c.moves.back().name);
}

// ============================================================================
// DATA INTEGRITY
// ============================================================================

TEST(Combatant, MissingStatIsDataIntegrityError) {
    PokemonProfile profile = make_profile("broken", {ElementType::NORMAL}, {50, 50, 50, 50, 50, 50});
    profile.base_stats.erase("speed");
    TEST_ASSERT_THROWS(derive_combatant(profile), DataIntegrityError);
}

TEST(Combatant, NegativeStatIsDataIntegrityError) {
    PokemonProfile profile = make_profile("broken", {ElementType::NORMAL}, {50, -1, 50, 50, 50, 50});
    TEST_ASSERT_THROWS(derive_combatant(profile), DataIntegrityError);

    PokemonProfile zero = make_profile("zero", {ElementType::NORMAL}, {0, 50, 50, 50, 50, 50});
    TEST_ASSERT_THROWS(derive_combatant(zero), DataIntegrityError);

    PokemonProfile huge = make_profile("huge", {ElementType::NORMAL}, {30000000, 50, 50, 50, 50, 50});
    TEST_ASSERT_THROWS(derive_combatant(huge), DataIntegrityError);

    PokemonProfile edge = make_profile("edge", {ElementType::NORMAL}, {255, 1, 255, 1, 255, 1});
    TEST_ASSERT_EQ(310, derive_combatant(edge).max_hp());
}

TEST(Combatant, TypeCountIsValidated) {
    PokemonProfile none = make_profile("typeless", {}, {50, 50, 50, 50, 50, 50});
    TEST_ASSERT_THROWS(derive_combatant(none), DataIntegrityError);

    PokemonProfile three = make_profile("triple", {ElementType::FIRE, ElementType::WATER, ElementType::GRASS},
                                        {50, 50, 50, 50, 50, 50});
    TEST_ASSERT_THROWS(derive_combatant(three), DataIntegrityError);
}

// ============================================================================
// HP AND STATUS SLOT
// ============================================================================

TEST(Combatant, TakeDamageClampsAtZero) {
    Combatant c = make_combatant("target", {ElementType::NORMAL}, {35, 50, 50, 50, 50, 50});
    TEST_ASSERT_EQ(30, c.take_damage(30));
    TEST_ASSERT_EQ(60, c.current_hp);
    TEST_ASSERT_EQ(60, c.take_damage(500));
    TEST_ASSERT_EQ(0, c.current_hp);
    TEST_ASSERT_TRUE(c.is_fainted());
    TEST_ASSERT_EQ(0, c.take_damage(10));
}

TEST(Combatant, StatusSlotHoldsOneKind) {
    Combatant c = make_combatant("target", {ElementType::NORMAL}, {50, 50, 50, 50, 50, 50});
    c.status = status::Sleep{2};
    TEST_ASSERT_TRUE(c.status_kind() == StatusKind::SLEEP);
    c.status = status::Burn{};
    TEST_ASSERT_TRUE(c.status_kind() == StatusKind::BURN);
    TEST_ASSERT_FALSE(std::holds_alternative<status::Sleep>(c.status));
}
