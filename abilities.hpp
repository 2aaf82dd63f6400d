#pragma once

#include <optional>
#include <set>
#include <vector>

#include "game_state.hpp"

namespace Abilities {
    struct Resolution {
        std::vector<hero_id_t> affected_heroes;
        // Heroes whose hit points reached zero, as they were when removed from play.
        std::vector<Hero> dead_heroes;
        std::optional<player_id_t> winner_id;
    };

    // Obstacles block the line of path, heroes do not.
    bool in_range(const GameState &game_state, const Hero &caster, const Ability &ability,
                  const Position &target);

    bool can_use_ability(const GameState &game_state, const Hero &caster, const Ability &ability,
                         const Position &target);

    std::set<Position> valid_targets(const GameState &game_state, const Hero &caster,
                                     const Ability &ability);

    std::set<Position> resolve_affected_cells(coordinate_t grid_size, const Position &target,
                                              const Ability &ability);

    int32_t damage_after_armor(int32_t amount, int32_t armor);

    Resolution apply_ability(GameState &game_state, const hero_id_t &caster_id,
                             const ability_id_t &ability_id, const Position &target);
}
