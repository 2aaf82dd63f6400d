#include "turn.hpp"

#include "movement.hpp"

namespace Turn {
    void require_in_progress(const GameState &game_state) {
        if (game_state.status != GameStatus::InProgress)
            throw IllegalIntent("Game is not in progress");
    }

    void require_active_player(const GameState &game_state, const player_id_t &player_id) {
        require_in_progress(game_state);
        if (!game_state.current_turn || *game_state.current_turn != player_id)
            throw IllegalIntent("Not your turn");
    }

    void start_game(GameState &game_state, const player_id_t &requester,
                    Setup::RandomNumberGenerator &random_number_generator,
                    const Setup::BoardSettings &settings) {
        if (game_state.status != GameStatus::Lobby)
            throw IllegalIntent("Game has already started");
        if (!game_state.is_full())
            throw IllegalIntent("Game is not full");
        for (auto &player: game_state.players) {
            if (!player.second.name || player.second.name->empty())
                throw IllegalIntent("All players must set their names");
        }
        if (!game_state.creator_id || *game_state.creator_id != requester)
            throw IllegalIntent("Only the game creator can start the game");

        Setup::generate_obstacles(game_state, random_number_generator, settings);
        Setup::place_heroes(game_state, random_number_generator, settings);
        refresh_heroes(game_state);
        game_state.moved_hero_id.reset();
        game_state.winner_id.reset();
        game_state.current_turn = game_state.creator_id;
        game_state.status = GameStatus::InProgress;
    }

    void refresh_heroes(GameState &game_state) {
        for (auto &player: game_state.players) {
            for (auto &hero: player.second.heroes) {
                hero.movement.refill();
                hero.action_points.refill();
                hero.start_position = hero.position;
            }
        }
    }

    void end_turn(GameState &game_state, const player_id_t &player_id) {
        require_active_player(game_state, player_id);

        game_state.moved_hero_id.reset();
        refresh_heroes(game_state);

        auto next_player = game_state.other_player(player_id);
        if (next_player && game_state.players.at(*next_player).connected)
            game_state.current_turn = next_player;
    }

    void undo_move(GameState &game_state, const player_id_t &player_id) {
        require_active_player(game_state, player_id);
        if (!Movement::undo_move(game_state))
            throw IllegalIntent("No turn state to restore");
    }

    std::optional<player_id_t> check_win_condition(GameState &game_state,
                                                   const player_id_t &acting_player) {
        if (game_state.status != GameStatus::InProgress)
            return std::nullopt;

        std::vector<player_id_t> eliminated;
        for (auto &player: game_state.players) {
            if (player.second.alive_count() == 0)
                eliminated.push_back(player.first);
        }
        if (eliminated.empty())
            return std::nullopt;

        std::optional<player_id_t> winner;
        if (eliminated.size() == 1)
            winner = game_state.other_player(eliminated.front());
        if (!winner)
            winner = acting_player;

        game_state.status = GameStatus::GameOver;
        game_state.winner_id = winner;
        return winner;
    }

    void player_disconnected(GameState &game_state, const player_id_t &player_id) {
        Player *player = game_state.find_player(player_id);
        if (player == nullptr)
            return;
        player->connected = false;

        if (game_state.status != GameStatus::InProgress || !game_state.current_turn ||
            *game_state.current_turn != player_id)
            return;
        auto next_player = game_state.other_player(player_id);
        if (next_player && game_state.players.at(*next_player).connected)
            end_turn(game_state, player_id);
    }

    void player_reconnected(GameState &game_state, const player_id_t &player_id) {
        Player *player = game_state.find_player(player_id);
        if (player == nullptr)
            return;
        player->connected = true;

        if (game_state.status != GameStatus::InProgress)
            return;
        if (game_state.current_turn) {
            const Player *active = game_state.find_player(*game_state.current_turn);
            if (active != nullptr && active->connected)
                return;
        }
        game_state.moved_hero_id.reset();
        refresh_heroes(game_state);
        game_state.current_turn = player_id;
    }
}
