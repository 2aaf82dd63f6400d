#include "game_room.hpp"

#include <iostream>

#include "abilities.hpp"
#include "chat_log.hpp"
#include "movement.hpp"
#include "turn.hpp"

namespace Authority {
    GameRoom::GameRoom(const std::string &game_id, coordinate_t grid_size,
                       const Setup::BoardSettings &settings, uint32_t seed)
            : game_state(game_id), settings(settings), random_number_generator(seed) {
        game_state.grid_size = grid_size;
    }

    JoinResult GameRoom::join(const player_id_t &player_id) {
        if (game_state.status == GameStatus::GameOver)
            return JoinResult::GameEnded;

        if (game_state.find_player(player_id) != nullptr) {
            Turn::player_reconnected(game_state, player_id);
            return JoinResult::Rejoined;
        }
        if (game_state.is_full())
            return JoinResult::RoomFull;

        Player player(player_id);
        player.connected = true;
        game_state.players[player_id] = player;
        if (!game_state.creator_id)
            game_state.creator_id = player_id;
        std::cout << "[" << game_state.game_id << "] " << player_id << " joined\n";
        return JoinResult::Joined;
    }

    bool GameRoom::leave(const player_id_t &player_id) {
        if (game_state.find_player(player_id) == nullptr)
            return false;
        Turn::player_disconnected(game_state, player_id);
        std::cout << "[" << game_state.game_id << "] " << player_id << " disconnected\n";
        return true;
    }

    bool GameRoom::is_abandoned() const {
        if (game_state.status == GameStatus::InProgress)
            return false;
        for (auto &player: game_state.players) {
            if (player.second.connected)
                return false;
        }
        return true;
    }

    Outcome GameRoom::handle(const player_id_t &player_id, const Message::ClientMessage &message) {
        Outcome outcome;
        try {
            if (game_state.find_player(player_id) == nullptr)
                throw IllegalIntent("Unknown player");
            std::visit([&](const auto &concrete) { apply(player_id, concrete, outcome); }, message);
        } catch (IllegalIntent &e) {
            outcome = Outcome();
            outcome.error = Message::ErrorMessage{e.what()};
        } catch (std::runtime_error &e) {
            std::cerr << "error: [" << game_state.game_id << "] " << e.what() << "\n";
            outcome = Outcome();
            outcome.error = Message::ErrorMessage{e.what()};
        }
        return outcome;
    }

    const Hero &GameRoom::own_hero(const player_id_t &player_id, const hero_id_t &hero_id) const {
        const Hero *hero = game_state.find_hero(hero_id);
        if (hero == nullptr)
            throw IllegalIntent("Hero not found");
        if (hero->owner_id != player_id)
            throw IllegalIntent("Not your hero");
        return *hero;
    }

    void GameRoom::apply(const player_id_t &player_id, const Message::MoveHeroMessage &message,
                         Outcome &outcome) {
        Turn::require_active_player(game_state, player_id);
        own_hero(player_id, message.hero_id);
        Movement::apply_move(game_state, message.hero_id, message.position);
        outcome.broadcast_state = true;
    }

    void GameRoom::apply(const player_id_t &player_id, const Message::UseAbilityMessage &message,
                         Outcome &outcome) {
        Turn::require_active_player(game_state, player_id);
        own_hero(player_id, message.hero_id);

        Position target;
        if (message.target_hero_id) {
            const Hero *target_hero = game_state.find_hero(*message.target_hero_id);
            if (target_hero == nullptr)
                throw IllegalIntent("Target hero not found");
            target = target_hero->position;
        } else if (message.target_position) {
            target = *message.target_position;
        } else {
            throw IllegalIntent("No target");
        }

        auto resolution = Abilities::apply_ability(game_state, message.hero_id, message.ability_id,
                                                   target);
        outcome.broadcast_state = true;
        outcome.dead_heroes = resolution.dead_heroes;
        outcome.winner_id = resolution.winner_id;
        if (resolution.winner_id)
            std::cout << "[" << game_state.game_id << "] " << *resolution.winner_id << " won\n";
    }

    void GameRoom::apply(const player_id_t &player_id, const Message::EndTurnMessage &,
                         Outcome &outcome) {
        Turn::end_turn(game_state, player_id);
        outcome.broadcast_state = true;
    }

    void GameRoom::apply(const player_id_t &player_id, const Message::UndoMoveMessage &,
                         Outcome &outcome) {
        Turn::undo_move(game_state, player_id);
        outcome.broadcast_state = true;
    }

    void GameRoom::apply(const player_id_t &player_id, const Message::UpdateNameMessage &message,
                         Outcome &outcome) {
        if (message.name.empty())
            throw IllegalIntent("Name must not be empty");
        game_state.players.at(player_id).name = message.name;
        outcome.broadcast_state = true;
    }

    void GameRoom::apply(const player_id_t &player_id, const Message::StartGameMessage &,
                         Outcome &outcome) {
        // Board generation can fail; the room keeps its lobby state and its generator when it does.
        GameState started = game_state;
        Setup::RandomNumberGenerator generator = random_number_generator;
        Turn::start_game(started, player_id, generator, settings);
        game_state = started;
        random_number_generator = generator;
        std::cout << "[" << game_state.game_id << "] game started\n";
        outcome.broadcast_state = true;
    }

    void GameRoom::apply(const player_id_t &player_id, const Message::SendChatMessage &message,
                         Outcome &outcome) {
        if (message.content.empty())
            throw IllegalIntent("Empty chat message");
        auto &player = game_state.players.at(player_id);
        std::string sender_name = player.name.value_or(
                message.player_name.empty() ? player_id : message.player_name);
        outcome.chat = Message::ChatMessage{player_id, sender_name, message.content,
                                            current_timestamp(),
                                            message.channel.empty() ? Message::GLOBAL_CHANNEL
                                                                    : message.channel};
    }

    Message::GameStateMessage GameRoom::snapshot(const Outcome &outcome) const {
        Message::GameStateMessage message;
        message.game_state = game_state;
        message.dead_heroes = outcome.dead_heroes;
        message.winner_id = outcome.winner_id;
        if (outcome.winner_id) {
            const Player *winner = game_state.find_player(*outcome.winner_id);
            message.winner_name = winner != nullptr && winner->name ? *winner->name
                                                                     : *outcome.winner_id;
        }
        return message;
    }
}
