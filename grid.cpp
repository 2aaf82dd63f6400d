#include "grid.hpp"

namespace Grid {
    GridModel::GridModel(const GameState &game_state) : grid_size(game_state.grid_size),
                                                        obstacles(game_state.obstacles) {
        for (auto &player: game_state.players) {
            for (auto &hero: player.second.heroes) {
                if (hero.alive())
                    place_hero(hero.id, hero.position);
            }
        }
    }

    GridModel::GridModel(coordinate_t grid_size, const std::set<Position> &obstacles) :
            grid_size(grid_size), obstacles(obstacles) {}

    std::optional<hero_id_t> GridModel::hero_at(const Position &position) const {
        auto it = hero_positions.find(position);
        if (it == hero_positions.end())
            return std::nullopt;
        return it->second;
    }

    bool GridModel::occupied_excluding(const Position &position, const hero_id_t &hero_id) const {
        auto it = hero_positions.find(position);
        return it != hero_positions.end() && it->second != hero_id;
    }
}
