/**
 * Tests for the Type Effectiveness Table
 */

#include "type_chart.hpp"

// ============================================================================
// VALUE DOMAIN
// ============================================================================

TEST(TypeChart, SingleLookupsInDomain) {
    for (int a = 0; a < ELEMENT_TYPE_COUNT; a++) {
        for (int d = 0; d < ELEMENT_TYPE_COUNT; d++) {
            double m = TypeChart::multiplier(static_cast<ElementType>(a), static_cast<ElementType>(d));
            TEST_ASSERT_MSG(m == 0.0 || m == 0.5 || m == 1.0 || m == 2.0,
                            std::string(to_string(static_cast<ElementType>(a))) + " vs " +
                            to_string(static_cast<ElementType>(d)));
        }
    }
}

TEST(TypeChart, DualLookupsInDomain) {
    for (int a = 0; a < ELEMENT_TYPE_COUNT; a++) {
        for (int d1 = 0; d1 < ELEMENT_TYPE_COUNT; d1++) {
            for (int d2 = 0; d2 < ELEMENT_TYPE_COUNT; d2++) {
                if (d1 == d2) continue;
                double m = TypeChart::effectiveness(
                    static_cast<ElementType>(a),
                    {static_cast<ElementType>(d1), static_cast<ElementType>(d2)});
                TEST_ASSERT(m == 0.0 || m == 0.25 || m == 0.5 || m == 1.0 || m == 2.0 || m == 4.0);
            }
        }
    }
}

// ============================================================================
// KNOWN MATCHUPS
// ============================================================================

TEST(TypeChart, KnownSingleMatchups) {
    TEST_ASSERT_EQ(2.0, TypeChart::multiplier(ElementType::ELECTRIC, ElementType::WATER));
    TEST_ASSERT_EQ(0.0, TypeChart::multiplier(ElementType::ELECTRIC, ElementType::GROUND));
    TEST_ASSERT_EQ(2.0, TypeChart::multiplier(ElementType::FIRE, ElementType::GRASS));
    TEST_ASSERT_EQ(0.5, TypeChart::multiplier(ElementType::FIRE, ElementType::WATER));
    TEST_ASSERT_EQ(0.0, TypeChart::multiplier(ElementType::NORMAL, ElementType::GHOST));
    TEST_ASSERT_EQ(0.0, TypeChart::multiplier(ElementType::GHOST, ElementType::NORMAL));
    TEST_ASSERT_EQ(0.0, TypeChart::multiplier(ElementType::DRAGON, ElementType::FAIRY));
    TEST_ASSERT_EQ(0.0, TypeChart::multiplier(ElementType::PSYCHIC, ElementType::DARK));
    TEST_ASSERT_EQ(0.0, TypeChart::multiplier(ElementType::GROUND, ElementType::FLYING));
    TEST_ASSERT_EQ(2.0, TypeChart::multiplier(ElementType::FIGHTING, ElementType::NORMAL));
    TEST_ASSERT_EQ(1.0, TypeChart::multiplier(ElementType::NORMAL, ElementType::NORMAL));
}

TEST(TypeChart, DualTypeMultipliesBothLookups) {
    const std::vector<ElementType> fire_flying = {ElementType::FIRE, ElementType::FLYING};
    TEST_ASSERT_EQ(2.0, TypeChart::effectiveness(ElementType::ELECTRIC, fire_flying));
    TEST_ASSERT_EQ(4.0, TypeChart::effectiveness(ElementType::ROCK, fire_flying));
    TEST_ASSERT_EQ(0.25, TypeChart::effectiveness(ElementType::GRASS, fire_flying));
    TEST_ASSERT_EQ(0.0, TypeChart::effectiveness(ElementType::GROUND, fire_flying));
}

TEST(TypeChart, StringTokens) {
    TEST_ASSERT_EQ(4.0, TypeChart::effectiveness("electric", std::vector<std::string>{"water", "flying"}));
    TEST_ASSERT_EQ(0.5, TypeChart::effectiveness("fire", std::vector<std::string>{"water"}));
}

// ============================================================================
// ERRORS
// ============================================================================

TEST(TypeChart, UnknownTokenIsDataIntegrityError) {
    TEST_ASSERT_THROWS(TypeChart::effectiveness("shadow", std::vector<std::string>{"water"}),
                       DataIntegrityError);
    TEST_ASSERT_THROWS(TypeChart::effectiveness("fire", std::vector<std::string>{"plasma"}),
                       DataIntegrityError);
}

TEST(TypeChart, DefenderNeedsOneOrTwoTypes) {
    TEST_ASSERT_THROWS(TypeChart::effectiveness(ElementType::FIRE, std::vector<ElementType>{}),
                       DataIntegrityError);
    TEST_ASSERT_THROWS(TypeChart::effectiveness(ElementType::FIRE,
                                                std::vector<ElementType>{ElementType::WATER,
                                                                         ElementType::GRASS,
                                                                         ElementType::ICE}),
                       DataIntegrityError);
}

TEST(TypeChart, Labels) {
    TEST_ASSERT_EQ(std::string("no effect"), TypeChart::label(0.0));
    TEST_ASSERT_EQ(std::string("not very effective"), TypeChart::label(0.25));
    TEST_ASSERT_EQ(std::string("not very effective"), TypeChart::label(0.5));
    TEST_ASSERT_EQ(std::string("normal"), TypeChart::label(1.0));
    TEST_ASSERT_EQ(std::string("super effective"), TypeChart::label(4.0));
}
