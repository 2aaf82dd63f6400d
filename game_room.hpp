#pragma once

#include <optional>
#include <string>
#include <vector>

#include "game_state.hpp"
#include "message.hpp"
#include "setup.hpp"

namespace Authority {
    enum class JoinResult {
        Joined,
        Rejoined,
        RoomFull,
        GameEnded
    };

    // What the server has to do after one intent.
    struct Outcome {
        bool broadcast_state = false;
        std::vector<Hero> dead_heroes;
        std::optional<player_id_t> winner_id;
        // Reply to the sender only.
        std::optional<Message::ErrorMessage> error;
        std::optional<Message::ChatMessage> chat;
    };

    // One game: lobby membership, connection flags and every intent re-validated with the rules
    // library before it touches the state.
    class GameRoom {
    public:
        GameRoom(const std::string &game_id, coordinate_t grid_size,
                 const Setup::BoardSettings &settings, uint32_t seed);

        JoinResult join(const player_id_t &player_id);

        // Returns true when the state changed and should be broadcast.
        bool leave(const player_id_t &player_id);

        Outcome handle(const player_id_t &player_id, const Message::ClientMessage &message);

        Message::GameStateMessage snapshot(const Outcome &outcome = Outcome()) const;

        const GameState &state() const {
            return game_state;
        }

        const Setup::RandomNumberGenerator &generator() const {
            return random_number_generator;
        }

        // Nobody connected and no game running; the server frees the room. A game in progress
        // waits for its players to come back.
        bool is_abandoned() const;

    private:
        void apply(const player_id_t &player_id, const Message::MoveHeroMessage &message,
                   Outcome &outcome);

        void apply(const player_id_t &player_id, const Message::UseAbilityMessage &message,
                   Outcome &outcome);

        void apply(const player_id_t &player_id, const Message::EndTurnMessage &message,
                   Outcome &outcome);

        void apply(const player_id_t &player_id, const Message::UndoMoveMessage &message,
                   Outcome &outcome);

        void apply(const player_id_t &player_id, const Message::UpdateNameMessage &message,
                   Outcome &outcome);

        void apply(const player_id_t &player_id, const Message::StartGameMessage &message,
                   Outcome &outcome);

        void apply(const player_id_t &player_id, const Message::SendChatMessage &message,
                   Outcome &outcome);

        const Hero &own_hero(const player_id_t &player_id, const hero_id_t &hero_id) const;

        GameState game_state;
        Setup::BoardSettings settings;
        Setup::RandomNumberGenerator random_number_generator;
    };
}
