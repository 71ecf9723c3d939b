/**
 * Pokemon Battle Engine - Type Effectiveness Table
 *
 * Static 18x18 attacking-vs-defending multiplier chart.
 * Process-wide and read-only; safe to query from any thread.
 */

#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace pokebattle {

class TypeChart {
public:
    /**
     * Single lookup. Always one of {0, 0.5, 1, 2}.
     */
    static double multiplier(ElementType attack, ElementType defend);

    /**
     * Product of the per-type lookups for a one- or two-type defender.
     *
     * Throws DataIntegrityError if defend_types is empty or has more than two entries.
     */
    static double effectiveness(ElementType attack, const std::vector<ElementType>& defend_types);

    /**
     * String-token variant used at the data boundary.
     *
     * Throws DataIntegrityError on unknown type tokens.
     */
    static double effectiveness(const std::string& attack,
                                const std::vector<std::string>& defend_types);

    /**
     * Human-readable label: "no effect", "not very effective", "normal", "super effective".
     */
    static const char* label(double multiplier);
};

} // namespace pokebattle
