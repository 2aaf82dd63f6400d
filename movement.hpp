#pragma once

#include <set>

#include "game_state.hpp"

namespace Movement {
    // Legal iff the game runs, it is the owner's turn, nobody has moved this turn, and target is
    // a different free cell within hero.movement.current steps.
    bool can_reach(const GameState &game_state, const Hero &hero, const Position &target);

    std::set<Position> compute_reachable_set(const GameState &game_state, const Hero &hero);

    // Moves the hero and takes the moved-hero lock. Movement points are a per-turn allowance,
    // so nothing is deducted.
    void apply_move(GameState &game_state, const hero_id_t &hero_id, const Position &target);

    // Returns false when there is no move to undo.
    bool undo_move(GameState &game_state);
}
