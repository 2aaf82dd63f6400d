#pragma once

#include <string>

#include "game_state.hpp"
#include "setup.hpp"

namespace Fixtures {
    const player_id_t ALICE = "alice";
    const player_id_t BOB = "bob";

    // Two connected, named players on an empty board, alice to move.
    inline GameState in_progress_state(coordinate_t grid_size = 10) {
        GameState game_state("test_game");
        game_state.grid_size = grid_size;
        Player alice(ALICE);
        alice.name = "Alice";
        alice.connected = true;
        Player bob(BOB);
        bob.name = "Bob";
        bob.connected = true;
        game_state.players[ALICE] = alice;
        game_state.players[BOB] = bob;
        game_state.creator_id = ALICE;
        game_state.current_turn = ALICE;
        game_state.status = GameStatus::InProgress;
        return game_state;
    }

    inline Hero &add_hero(GameState &game_state, const player_id_t &owner, const Position &position) {
        auto &heroes = game_state.players.at(owner).heroes;
        heroes.push_back(Setup::make_hero(owner, heroes.size(), position));
        return heroes.back();
    }

    inline Ability ability(const ability_id_t &id, int32_t range, EffectKind kind, int32_t amount) {
        Ability result;
        result.id = id;
        result.name = id;
        result.range = range;
        result.action_cost = 1;
        result.effect.kind = kind;
        result.effect.amount = amount;
        return result;
    }
}
