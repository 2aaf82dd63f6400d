#pragma once

#include <optional>

#include "game_state.hpp"
#include "setup.hpp"

namespace Turn {
    void require_in_progress(const GameState &game_state);

    void require_active_player(const GameState &game_state, const player_id_t &player_id);

    // lobby -> in_progress. Needs a full room, named players, and the creator asking.
    void start_game(GameState &game_state, const player_id_t &requester,
                    Setup::RandomNumberGenerator &random_number_generator,
                    const Setup::BoardSettings &settings);

    // Refills per-turn resources and records where every hero starts the new turn.
    void refresh_heroes(GameState &game_state);

    void end_turn(GameState &game_state, const player_id_t &player_id);

    void undo_move(GameState &game_state, const player_id_t &player_id);

    // Latches game_over and the winner when a side has no living hero left. Returns the winner
    // only when the game ended in this call.
    std::optional<player_id_t> check_win_condition(GameState &game_state,
                                                   const player_id_t &acting_player);

    void player_disconnected(GameState &game_state, const player_id_t &player_id);

    // Marks the player connected. An in-progress game whose active player is away hands the turn
    // to the returning player.
    void player_reconnected(GameState &game_state, const player_id_t &player_id);
}
