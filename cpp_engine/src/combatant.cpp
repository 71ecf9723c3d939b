/**
 * Pokemon Battle Engine - Combatant Implementation
 */

#include "combatant.hpp"
#include "errors.hpp"

namespace pokebattle {

namespace {

int require_base_stat(const PokemonProfile& profile, const char* stat_name) {
    auto it = profile.base_stats.find(stat_name);
    if (it == profile.base_stats.end()) {
        throw DataIntegrityError("Pokemon '" + profile.name + "' is missing base stat: " + stat_name);
    }
    if (it->second < MIN_BASE_STAT || it->second > MAX_BASE_STAT) {
        throw DataIntegrityError("Pokemon '" + profile.name + "' has out-of-range base stat: " +
                                 stat_name + " = " + std::to_string(it->second));
    }
    return it->second;
}

} // namespace

StatusKind kind_of(const StatusSlot& slot) {
    switch (slot.index()) {
        case 1: return StatusKind::BURN;
        case 2: return StatusKind::POISON;
        case 3: return StatusKind::PARALYSIS;
        case 4: return StatusKind::SLEEP;
        case 5: return StatusKind::FREEZE;
        case 6: return StatusKind::CONFUSION;
        default: return StatusKind::NONE;
    }
}

Combatant derive_combatant(const PokemonProfile& profile, std::vector<MoveDef> moves) {
    if (profile.types.empty() || profile.types.size() > 2) {
        throw DataIntegrityError("Pokemon '" + profile.name + "' must have one or two types");
    }

    Combatant combatant;
    combatant.name = profile.name;
    combatant.types = profile.types;

    combatant.stats.hp = scale_hp(require_base_stat(profile, "hp"));
    combatant.stats.attack = scale_stat(require_base_stat(profile, "attack"));
    combatant.stats.defense = scale_stat(require_base_stat(profile, "defense"));
    combatant.stats.special_attack = scale_stat(require_base_stat(profile, "special-attack"));
    combatant.stats.special_defense = scale_stat(require_base_stat(profile, "special-defense"));
    combatant.stats.speed = scale_stat(require_base_stat(profile, "speed"));

    if (moves.size() > MAX_MOVE_SLOTS) {
        moves.resize(MAX_MOVE_SLOTS);
    }
    combatant.moves = std::move(moves);

    combatant.current_hp = combatant.stats.hp;
    combatant.status = status::None{};

    return combatant;
}

} // namespace pokebattle
