#include "movement.hpp"

#include "grid.hpp"
#include "path_finding.hpp"

namespace Movement {
    static bool may_move_now(const GameState &game_state, const Hero &hero) {
        if (game_state.status != GameStatus::InProgress)
            return false;
        if (!game_state.current_turn || *game_state.current_turn != hero.owner_id)
            return false;
        if (game_state.moved_hero_id)
            return false;
        return hero.alive();
    }

    static bool path_exists(const Grid::GridModel &grid, const Hero &hero, const Position &target) {
        if (target == hero.position)
            return false;
        return PathFinding::find_path(grid, hero.position, target, hero.movement.current, false,
                                      hero.id).has_value();
    }

    bool can_reach(const GameState &game_state, const Hero &hero, const Position &target) {
        if (!may_move_now(game_state, hero))
            return false;
        Grid::GridModel grid(game_state);
        return path_exists(grid, hero, target);
    }

    std::set<Position> compute_reachable_set(const GameState &game_state, const Hero &hero) {
        std::set<Position> reachable;
        if (!may_move_now(game_state, hero))
            return reachable;

        Grid::GridModel grid(game_state);
        int32_t budget = hero.movement.current;
        for (coordinate_t dy = -budget; dy <= budget; ++dy) {
            for (coordinate_t dx = -budget; dx <= budget; ++dx) {
                Position candidate(hero.position.x + dx, hero.position.y + dy);
                // A path is never shorter than the Manhattan distance.
                if (manhattan_distance(hero.position, candidate) > budget)
                    continue;
                if (!grid.is_in_bounds(candidate))
                    continue;
                if (path_exists(grid, hero, candidate))
                    reachable.insert(candidate);
            }
        }
        return reachable;
    }

    void apply_move(GameState &game_state, const hero_id_t &hero_id, const Position &target) {
        Hero *hero = game_state.find_hero(hero_id);
        if (hero == nullptr)
            throw IllegalIntent("Hero not found");
        if (game_state.status != GameStatus::InProgress)
            throw IllegalIntent("Game is not in progress");
        if (!game_state.current_turn || *game_state.current_turn != hero->owner_id)
            throw IllegalIntent("Not your turn");
        if (game_state.moved_hero_id)
            throw IllegalIntent("A hero has already moved this turn");
        if (!can_reach(game_state, *hero, target))
            throw IllegalIntent("Invalid move");

        hero->position = target;
        game_state.moved_hero_id = hero->id;
    }

    bool undo_move(GameState &game_state) {
        if (!game_state.moved_hero_id)
            return false;
        Hero *hero = game_state.find_hero(*game_state.moved_hero_id);
        if (hero != nullptr)
            hero->position = hero->start_position;
        game_state.moved_hero_id.reset();
        return true;
    }
}
