/**
 * Tests for the Turn Scheduler
 */

#include "turn_scheduler.hpp"

// ============================================================================
// ORDERING
// ============================================================================

TEST(TurnScheduler, FasterActsFirst) {
    Combatant pikachu = shipped_combatant("pikachu");
    Combatant charizard = shipped_combatant("charizard");

    auto [first, second] = order_actions(pikachu, charizard);
    TEST_ASSERT_EQ(1, static_cast<int>(first));
    TEST_ASSERT_EQ(0, static_cast<int>(second));

    auto swapped = order_actions(charizard, pikachu);
    TEST_ASSERT_EQ(0, static_cast<int>(swapped.first));
}

TEST(TurnScheduler, SpeedTieFavorsFirstListed) {
    Combatant a = make_combatant("a", {ElementType::NORMAL}, {50, 50, 50, 50, 50, 80});
    Combatant b = make_combatant("b", {ElementType::NORMAL}, {50, 50, 50, 50, 50, 80});
    TEST_ASSERT_EQ(0, static_cast<int>(order_actions(a, b).first));
    TEST_ASSERT_EQ(0, static_cast<int>(order_actions(b, a).first));
}

TEST(TurnScheduler, ParalysisCanFlipOrder) {
    Combatant pikachu = shipped_combatant("pikachu");
    Combatant charizard = shipped_combatant("charizard");
    charizard.status = status::Paralysis{};

    // 105 / 2 = 52 < 95
    TEST_ASSERT_EQ(0, static_cast<int>(order_actions(pikachu, charizard).first));
}

// ============================================================================
// MOVE SELECTION
// ============================================================================

TEST(TurnScheduler, PicksHighestExpectedDamage) {
    Combatant pikachu = shipped_combatant("pikachu");
    Combatant charizard = shipped_combatant("charizard");

    const MoveDef* pikachu_move = select_move(pikachu, charizard);
    TEST_ASSERT_NOT_NULL(pikachu_move);
    TEST_ASSERT_EQ(std::string("thunderbolt"), pikachu_move->name);

    const MoveDef* charizard_move = select_move(charizard, pikachu);
    TEST_ASSERT_NOT_NULL(charizard_move);
    TEST_ASSERT_EQ(std::string("flamethrower"), charizard_move->name);
}

TEST(TurnScheduler, AvoidsImmuneMoves) {
    Combatant pikachu = shipped_combatant("pikachu");
    Combatant golem = shipped_combatant("golem");

    const MoveDef* move = select_move(pikachu, golem);
    TEST_ASSERT_EQ(std::string("quick-attack"), move->name);
    TEST_ASSERT_NEAR(20.0, expected_damage_score(pikachu, golem, *move), 1e-9);
}

TEST(TurnScheduler, ExpectedScoreUsesAccuracy) {
    Combatant raichu = shipped_combatant("raichu");
    Combatant blastoise = shipped_combatant("blastoise");
    const MoveDef& thunder = shipped_pokedex().lookup_move("thunder");

    // 110 * 0.70 * 1.5 * 2
    TEST_ASSERT_NEAR(231.0, expected_damage_score(raichu, blastoise, thunder), 1e-9);

    // 90 * 1.0 * 1.5 * 2 = 270 beats the less accurate move
    TEST_ASSERT_EQ(std::string("thunderbolt"), select_move(raichu, blastoise)->name);
}

TEST(TurnScheduler, TieKeepsEarliestMove) {
    std::vector<MoveDef> moves = {
        make_move("first", ElementType::NORMAL, MoveCategory::PHYSICAL, 50),
        make_move("second", ElementType::NORMAL, MoveCategory::SPECIAL, 50),
    };
    Combatant attacker = make_combatant("attacker", {ElementType::WATER}, {50, 50, 50, 50, 50, 50}, moves);
    Combatant defender = make_combatant("defender", {ElementType::WATER}, {50, 50, 50, 50, 50, 50});
    TEST_ASSERT_EQ(std::string("first"), select_move(attacker, defender)->name);
}

TEST(TurnScheduler, StatusMoveWhenNothingDamages) {
    std::vector<MoveDef> moves = {
        make_move("tackle", ElementType::NORMAL, MoveCategory::PHYSICAL, 40),
        make_move("growl", ElementType::NORMAL, MoveCategory::STATUS, 0),
        make_move("spore", ElementType::GRASS, MoveCategory::STATUS, 0, 100,
                  SecondaryEffect{StatusKind::SLEEP, 1.0}),
    };
    Combatant attacker = make_combatant("attacker", {ElementType::NORMAL}, {50, 50, 50, 50, 50, 50}, moves);
    Combatant ghost = make_combatant("ghost", {ElementType::GHOST}, {50, 50, 50, 50, 50, 50});

    TEST_ASSERT_EQ(std::string("spore"), select_move(attacker, ghost)->name);

    // Already afflicted: fall back to the first move
    ghost.status = status::Burn{};
    TEST_ASSERT_EQ(std::string("tackle"), select_move(attacker, ghost)->name);
}

TEST(TurnScheduler, NoMovesSelectsNothing) {
    Combatant attacker = make_combatant("empty", {ElementType::NORMAL}, {50, 50, 50, 50, 50, 50});
    Combatant defender = make_combatant("defender", {ElementType::NORMAL}, {50, 50, 50, 50, 50, 50});
    TEST_ASSERT_NULL(select_move(attacker, defender));
}
