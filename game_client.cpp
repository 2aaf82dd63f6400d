#include "game_client.hpp"

#include <iostream>

#include "abilities.hpp"
#include "deserialization.hpp"
#include "movement.hpp"
#include "serialization.hpp"

namespace Client {
    void GameClient::handle_raw_message(const std::string &text) {
        try {
            handle_message(Deserialization::parse_server_message(text));
        } catch (MalformedMessage &e) {
            std::cerr << "error: dropping malformed message: " << e.what() << "\n";
        }
    }

    void GameClient::handle_message(const Message::ServerMessage &message) {
        if (auto snapshot = std::get_if<Message::GameStateMessage>(&message))
            apply_snapshot(*snapshot);
        else if (auto chat = std::get_if<Message::ChatMessage>(&message))
            sink.on_chat_message(*chat);
        else if (auto error = std::get_if<Message::ErrorMessage>(&message))
            sink.on_error(error->message);
    }

    static bool living_hero_exists(const GameState &game_state,
                                   const std::optional<hero_id_t> &hero_id) {
        if (!hero_id)
            return true;
        const Hero *hero = game_state.find_hero(*hero_id);
        return hero != nullptr && hero->alive();
    }

    void GameClient::apply_snapshot(const Message::GameStateMessage &message) {
        std::optional<player_id_t> previous_turn;
        if (game_state)
            previous_turn = game_state->current_turn;

        game_state = message.game_state;

        if (!living_hero_exists(*game_state, current_selection.hero_id)) {
            current_selection.hero_id.reset();
            current_selection.ability_id.reset();
        }
        if (!living_hero_exists(*game_state, current_selection.hovered_hero_id))
            current_selection.hovered_hero_id.reset();
        if (previous_turn != game_state->current_turn || game_state->winner_id)
            clear_selection();

        sink.on_snapshot(*game_state);
        for (auto &hero: message.dead_heroes)
            sink.on_hero_died(hero, Presentation::DEATH_CUE);
        if (message.winner_id)
            sink.on_game_over(*message.winner_id, message.winner_name.value_or(*message.winner_id));
    }

    bool GameClient::is_my_turn() const {
        return game_state && game_state->status == GameStatus::InProgress &&
               game_state->current_turn && *game_state->current_turn == my_player_id;
    }

    bool GameClient::select_hero(const hero_id_t &hero_id) {
        if (!game_state)
            return false;
        const Hero *hero = game_state->find_hero(hero_id);
        if (hero == nullptr || !hero->alive() || hero->owner_id != my_player_id)
            return false;
        if (current_selection.hero_id != hero_id)
            current_selection.ability_id.reset();
        current_selection.hero_id = hero_id;
        return true;
    }

    bool GameClient::select_ability(const ability_id_t &ability_id) {
        const Hero *hero = selected_hero();
        if (hero == nullptr || hero->find_ability(ability_id) == nullptr)
            return false;
        current_selection.ability_id = ability_id;
        return true;
    }

    void GameClient::hover_hero(const std::optional<hero_id_t> &hero_id) {
        if (hero_id && (!game_state || !living_hero_exists(*game_state, hero_id)))
            return;
        current_selection.hovered_hero_id = hero_id;
    }

    void GameClient::clear_selection() {
        current_selection = Selection();
    }

    const Hero *GameClient::selected_hero() const {
        if (!game_state || !current_selection.hero_id)
            return nullptr;
        return game_state->find_hero(*current_selection.hero_id);
    }

    const Ability *GameClient::selected_ability() const {
        const Hero *hero = selected_hero();
        if (hero == nullptr || !current_selection.ability_id)
            return nullptr;
        return hero->find_ability(*current_selection.ability_id);
    }

    std::set<Position> GameClient::reachable_preview() const {
        const Hero *hero = selected_hero();
        if (hero == nullptr)
            return {};
        return Movement::compute_reachable_set(*game_state, *hero);
    }

    std::set<Position> GameClient::ability_targets_preview() const {
        const Hero *hero = selected_hero();
        const Ability *ability = selected_ability();
        if (hero == nullptr || ability == nullptr)
            return {};
        return Abilities::valid_targets(*game_state, *hero, *ability);
    }

    std::set<Position> GameClient::area_preview(const Position &target) const {
        const Hero *hero = selected_hero();
        const Ability *ability = selected_ability();
        if (hero == nullptr || ability == nullptr ||
            !Abilities::can_use_ability(*game_state, *hero, *ability, target))
            return {};
        return Abilities::resolve_affected_cells(game_state->grid_size, target, *ability);
    }

    bool GameClient::reject(const std::string &reason) {
        sink.on_error(reason);
        return false;
    }

    bool GameClient::send(const std::string &text) {
        if (!connection.send(text))
            return reject("Not connected");
        return true;
    }

    bool GameClient::request_move(const Position &target) {
        const Hero *hero = selected_hero();
        if (hero == nullptr)
            return reject("No hero selected");
        if (!Movement::can_reach(*game_state, *hero, target))
            return reject("Invalid move");
        return send(Serialization::serialize(Message::MoveHeroMessage{hero->id, target}));
    }

    bool GameClient::request_ability(const Position &target) {
        const Hero *hero = selected_hero();
        const Ability *ability = selected_ability();
        if (hero == nullptr || ability == nullptr)
            return reject("No ability selected");
        if (!Abilities::can_use_ability(*game_state, *hero, *ability, target))
            return reject("Ability cannot be used there");

        Message::UseAbilityMessage message;
        message.hero_id = hero->id;
        message.ability_id = ability->id;
        message.target_position = target;
        if (!send(Serialization::serialize(message)))
            return false;
        sink.on_ability_used(*hero, *ability, Presentation::ability_cue(ability->id));
        return true;
    }

    bool GameClient::request_ability_on_hero(const hero_id_t &target_hero_id) {
        const Hero *hero = selected_hero();
        const Ability *ability = selected_ability();
        if (hero == nullptr || ability == nullptr)
            return reject("No ability selected");
        const Hero *target = game_state->find_hero(target_hero_id);
        if (target == nullptr)
            return reject("Hero not found");
        if (!Abilities::can_use_ability(*game_state, *hero, *ability, target->position))
            return reject("Ability cannot be used there");

        Message::UseAbilityMessage message;
        message.hero_id = hero->id;
        message.ability_id = ability->id;
        message.target_hero_id = target_hero_id;
        if (!send(Serialization::serialize(message)))
            return false;
        sink.on_ability_used(*hero, *ability, Presentation::ability_cue(ability->id));
        return true;
    }

    bool GameClient::request_end_turn() {
        if (!is_my_turn())
            return reject("Not your turn");
        return send(Serialization::serialize(Message::EndTurnMessage{game_id, my_player_id}));
    }

    bool GameClient::request_undo() {
        if (!is_my_turn())
            return reject("Not your turn");
        if (!game_state->moved_hero_id)
            return reject("No turn state to restore");
        return send(Serialization::serialize(Message::UndoMoveMessage{}));
    }

    bool GameClient::request_update_name(const std::string &name) {
        if (name.empty())
            return reject("Name must not be empty");
        if (!send(Serialization::serialize(Message::UpdateNameMessage{name})))
            return false;
        my_name = name;
        return true;
    }

    bool GameClient::request_start_game() {
        if (!game_state || game_state->status != GameStatus::Lobby)
            return reject("Game has already started");
        if (!game_state->is_full())
            return reject("Game is not full");
        if (!game_state->creator_id || *game_state->creator_id != my_player_id)
            return reject("Only the game creator can start the game");
        return send(Serialization::serialize(Message::StartGameMessage{}));
    }

    bool GameClient::send_chat(const std::string &content, const std::string &channel) {
        if (content.empty())
            return false;
        return send(Serialization::serialize(Message::SendChatMessage{content, channel,
                                                                      my_name.empty()
                                                                      ? my_player_id
                                                                      : my_name}));
    }
}
