#pragma once

#include <map>
#include <optional>
#include <set>

#include "game_state.hpp"

namespace Grid {
    // Read-only view of one snapshot: bounds, obstacles and which hero stands where.
    struct GridModel {
        explicit GridModel(const GameState &game_state);

        GridModel(coordinate_t grid_size, const std::set<Position> &obstacles);

        coordinate_t grid_size;
        std::set<Position> obstacles;
        std::map<Position, hero_id_t> hero_positions;

        void place_hero(const hero_id_t &hero_id, const Position &position) {
            hero_positions[position] = hero_id;
        }

        bool is_in_bounds(const Position &position) const {
            return 0 <= position.x && position.x < grid_size &&
                   0 <= position.y && position.y < grid_size;
        }

        bool is_obstacle(const Position &position) const {
            return obstacles.contains(position);
        }

        std::optional<hero_id_t> hero_at(const Position &position) const;

        // True when a hero other than hero_id stands on position.
        bool occupied_excluding(const Position &position, const hero_id_t &hero_id) const;
    };
}
