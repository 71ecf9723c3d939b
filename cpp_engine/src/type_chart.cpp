/**
 * Pokemon Battle Engine - Type Effectiveness Table Implementation
 */

#include "type_chart.hpp"
#include "errors.hpp"

namespace pokebattle {

namespace {

// Rows: attacking type. Columns: defending type.
// Order: NOR FIR WAT ELE GRA ICE FIG POI GRO FLY PSY BUG ROC GHO DRA DAR STE FAI
constexpr double kChart[ELEMENT_TYPE_COUNT][ELEMENT_TYPE_COUNT] = {
    /* NORMAL   */ {1, 1,   1,   1,   1,   1,   1,   1,   1,   1,   1,   1,   0.5, 0,   1,   1,   0.5, 1  },
    /* FIRE     */ {1, 0.5, 0.5, 1,   2,   2,   1,   1,   1,   1,   1,   2,   0.5, 1,   0.5, 1,   2,   1  },
    /* WATER    */ {1, 2,   0.5, 1,   0.5, 1,   1,   1,   2,   1,   1,   1,   2,   1,   0.5, 1,   1,   1  },
    /* ELECTRIC */ {1, 1,   2,   0.5, 0.5, 1,   1,   1,   0,   2,   1,   1,   1,   1,   0.5, 1,   1,   1  },
    /* GRASS    */ {1, 0.5, 2,   1,   0.5, 1,   1,   0.5, 2,   0.5, 1,   0.5, 2,   1,   0.5, 1,   0.5, 1  },
    /* ICE      */ {1, 0.5, 0.5, 1,   2,   0.5, 1,   1,   2,   2,   1,   1,   1,   1,   2,   1,   0.5, 1  },
    /* FIGHTING */ {2, 1,   1,   1,   1,   2,   1,   0.5, 1,   0.5, 0.5, 0.5, 2,   0,   1,   2,   2,   0.5},
    /* POISON   */ {1, 1,   1,   1,   2,   1,   1,   0.5, 0.5, 1,   1,   1,   0.5, 0.5, 1,   1,   0,   2  },
    /* GROUND   */ {1, 2,   1,   2,   0.5, 1,   1,   2,   1,   0,   1,   0.5, 2,   1,   1,   1,   2,   1  },
    /* FLYING   */ {1, 1,   1,   0.5, 2,   1,   2,   1,   1,   1,   1,   2,   0.5, 1,   1,   1,   0.5, 1  },
    /* PSYCHIC  */ {1, 1,   1,   1,   1,   1,   2,   2,   1,   1,   0.5, 1,   1,   1,   1,   0,   0.5, 1  },
    /* BUG      */ {1, 0.5, 1,   1,   2,   1,   0.5, 0.5, 1,   0.5, 2,   1,   1,   0.5, 1,   2,   0.5, 0.5},
    /* ROCK     */ {1, 2,   1,   1,   1,   2,   0.5, 1,   0.5, 2,   1,   2,   1,   1,   1,   1,   0.5, 1  },
    /* GHOST    */ {0, 1,   1,   1,   1,   1,   1,   1,   1,   1,   2,   1,   1,   2,   1,   0.5, 1,   1  },
    /* DRAGON   */ {1, 1,   1,   1,   1,   1,   1,   1,   1,   1,   1,   1,   1,   1,   2,   1,   0.5, 0  },
    /* DARK     */ {1, 1,   1,   1,   1,   1,   0.5, 1,   1,   1,   2,   1,   1,   2,   1,   0.5, 1,   0.5},
    /* STEEL    */ {1, 0.5, 0.5, 0.5, 1,   2,   1,   1,   1,   1,   1,   1,   2,   1,   1,   1,   0.5, 2  },
    /* FAIRY    */ {1, 0.5, 1,   1,   1,   1,   2,   0.5, 1,   1,   1,   1,   1,   1,   2,   2,   0.5, 1  },
};

ElementType require_type(const std::string& token) {
    auto parsed = parse_element_type(token);
    if (!parsed) {
        throw DataIntegrityError("Unknown type: " + token);
    }
    return *parsed;
}

} // namespace

double TypeChart::multiplier(ElementType attack, ElementType defend) {
    return kChart[static_cast<int>(attack)][static_cast<int>(defend)];
}

double TypeChart::effectiveness(ElementType attack, const std::vector<ElementType>& defend_types) {
    if (defend_types.empty() || defend_types.size() > 2) {
        throw DataIntegrityError("Defender must have one or two types, got " +
                                 std::to_string(defend_types.size()));
    }

    double result = 1.0;
    for (ElementType defend : defend_types) {
        result *= multiplier(attack, defend);
    }
    return result;
}

double TypeChart::effectiveness(const std::string& attack,
                                const std::vector<std::string>& defend_types) {
    std::vector<ElementType> parsed;
    parsed.reserve(defend_types.size());
    for (const auto& token : defend_types) {
        parsed.push_back(require_type(token));
    }
    return effectiveness(require_type(attack), parsed);
}

const char* TypeChart::label(double multiplier) {
    if (multiplier == 0.0) return "no effect";
    if (multiplier < 1.0) return "not very effective";
    if (multiplier > 1.0) return "super effective";
    return "normal";
}

} // namespace pokebattle
