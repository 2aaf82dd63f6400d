#include "deserialization.hpp"

using nlohmann::json;

template<typename T>
static std::optional<T> optional_field(const json &j, const char *key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    return it->get<T>();
}

void from_json(const json &j, Position &position) {
    j.at("x").get_to(position.x);
    j.at("y").get_to(position.y);
}

void from_json(const json &j, Gauge &gauge) {
    j.at("current").get_to(gauge.current);
    j.at("maximum").get_to(gauge.maximum);
}

void from_json(const json &j, Effect &effect) {
    auto kind = j.at("type").get<std::string>();
    if (kind == "heal")
        effect.kind = EffectKind::Heal;
    else if (kind == "damage")
        effect.kind = EffectKind::Damage;
    else
        throw MalformedMessage("Unknown effect type: " + kind);
    j.at("amount").get_to(effect.amount);
    effect.area_of_effect = optional_field<int32_t>(j, "area_of_effect");
    auto shape = optional_field<std::string>(j, "area_shape");
    effect.area_shape = shape && *shape == "square" ? AreaShape::Square : AreaShape::Circle;
}

void from_json(const json &j, Ability &ability) {
    j.at("id").get_to(ability.id);
    j.at("name").get_to(ability.name);
    j.at("range").get_to(ability.range);
    j.at("action_cost").get_to(ability.action_cost);
    ability.mana_cost = optional_field<int32_t>(j, "mana_cost").value_or(0);
    j.at("effect").get_to(ability.effect);
}

void from_json(const json &j, Hero &hero) {
    j.at("id").get_to(hero.id);
    j.at("owner_id").get_to(hero.owner_id);
    j.at("name").get_to(hero.name);
    j.at("position").get_to(hero.position);
    hero.start_position = optional_field<Position>(j, "start_position").value_or(hero.position);
    j.at("hp").get_to(hero.hp);
    j.at("movement").get_to(hero.movement);
    j.at("action_points").get_to(hero.action_points);
    j.at("mana").get_to(hero.mana);
    j.at("damage").get_to(hero.damage);
    j.at("armor").get_to(hero.armor);
    j.at("abilities").get_to(hero.abilities);
}

void from_json(const json &j, Player &player) {
    j.at("player_id").get_to(player.player_id);
    player.name = optional_field<std::string>(j, "name");
    player.connected = optional_field<bool>(j, "connected").value_or(false);
    j.at("heroes").get_to(player.heroes);
}

void from_json(const json &j, GameState &game_state) {
    j.at("game_id").get_to(game_state.game_id);

    game_state.players.clear();
    for (auto &item: j.at("players").items())
        game_state.players[item.key()] = item.value().get<Player>();

    game_state.current_turn = optional_field<player_id_t>(j, "current_turn");
    game_state.creator_id = optional_field<player_id_t>(j, "creator_id");

    auto status = status_from_name(j.at("status").get<std::string>());
    if (!status)
        throw MalformedMessage("Unknown game status");
    game_state.status = *status;

    j.at("grid_size").get_to(game_state.grid_size);

    game_state.obstacles.clear();
    for (auto &key: j.at("obstacles"))
        game_state.obstacles.insert(position_from_key(key.get<std::string>()));

    game_state.moved_hero_id = optional_field<hero_id_t>(j, "moved_hero_id");
    game_state.winner_id = optional_field<player_id_t>(j, "winner_id");
}

namespace Deserialization {
    static json parse_envelope(const std::string &text, std::string &type) {
        json j = json::parse(text);
        if (!j.is_object())
            throw MalformedMessage("Message is not an object");
        j.at("type").get_to(type);
        return j;
    }

    static json payload_of(const json &j) {
        auto it = j.find("payload");
        if (it == j.end() || it->is_null())
            return json::object();
        if (!it->is_object())
            throw MalformedMessage("Payload is not an object");
        return *it;
    }

    static Message::ServerMessage read_server_message(const std::string &text) {
        std::string type;
        json j = parse_envelope(text, type);
        json payload = payload_of(j);

        if (type == Message::GAME_STATE_TYPE) {
            Message::GameStateMessage message;
            message.game_state = payload.get<GameState>();
            if (j.contains("dead_heroes") && !j["dead_heroes"].is_null())
                message.dead_heroes = j["dead_heroes"].get<std::vector<Hero>>();
            message.winner_id = optional_field<player_id_t>(j, "winner_id");
            message.winner_name = optional_field<std::string>(j, "winner_name");
            return message;
        }
        if (type == Message::CHAT_MESSAGE_TYPE) {
            Message::ChatMessage message;
            payload.at("sender_id").get_to(message.sender_id);
            message.sender_name = optional_field<std::string>(payload, "sender_name")
                    .value_or(message.sender_id);
            payload.at("content").get_to(message.content);
            message.timestamp = optional_field<std::string>(payload, "timestamp").value_or("");
            message.channel = optional_field<std::string>(payload, "channel")
                    .value_or(Message::GLOBAL_CHANNEL);
            return message;
        }
        if (type == Message::ERROR_TYPE)
            return Message::ErrorMessage{payload.at("message").get<std::string>()};
        throw MalformedMessage("Unknown message type: " + type);
    }

    static Message::ClientMessage read_client_message(const std::string &text) {
        std::string type;
        json j = parse_envelope(text, type);
        json payload = payload_of(j);

        if (type == Message::MOVE_HERO_TYPE)
            return Message::MoveHeroMessage{payload.at("hero_id").get<hero_id_t>(),
                                            payload.at("position").get<Position>()};
        if (type == Message::USE_ABILITY_TYPE) {
            Message::UseAbilityMessage message;
            payload.at("hero_id").get_to(message.hero_id);
            payload.at("ability_id").get_to(message.ability_id);
            message.target_position = optional_field<Position>(payload, "target_position");
            message.target_hero_id = optional_field<hero_id_t>(payload, "target_hero_id");
            if (message.target_position.has_value() == message.target_hero_id.has_value())
                throw MalformedMessage("Exactly one ability target is required");
            return message;
        }
        if (type == Message::END_TURN_TYPE)
            return Message::EndTurnMessage{optional_field<std::string>(j, "game_id").value_or(""),
                                           optional_field<player_id_t>(j, "player_id").value_or("")};
        if (type == Message::UNDO_MOVE_TYPE)
            return Message::UndoMoveMessage{};
        if (type == Message::UPDATE_NAME_TYPE)
            return Message::UpdateNameMessage{payload.at("name").get<std::string>()};
        if (type == Message::START_GAME_TYPE)
            return Message::StartGameMessage{};
        if (type == Message::CHAT_MESSAGE_TYPE) {
            Message::SendChatMessage message;
            payload.at("content").get_to(message.content);
            message.channel = optional_field<std::string>(payload, "channel")
                    .value_or(Message::GLOBAL_CHANNEL);
            message.player_name = optional_field<std::string>(payload, "player_name").value_or("");
            return message;
        }
        throw MalformedMessage("Unknown message type: " + type);
    }

    Message::ServerMessage parse_server_message(const std::string &text) {
        try {
            return read_server_message(text);
        } catch (json::exception &e) {
            throw MalformedMessage(e.what());
        } catch (std::logic_error &e) {
            throw MalformedMessage(e.what());
        }
    }

    Message::ClientMessage parse_client_message(const std::string &text) {
        try {
            return read_client_message(text);
        } catch (json::exception &e) {
            throw MalformedMessage(e.what());
        } catch (std::logic_error &e) {
            throw MalformedMessage(e.what());
        }
    }
}
