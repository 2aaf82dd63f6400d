#include "serialization.hpp"

using nlohmann::json;

template<typename T>
static json optional_to_json(const std::optional<T> &value) {
    if (!value)
        return nullptr;
    return json(*value);
}

void to_json(json &j, const Position &position) {
    j = json{{"x", position.x},
             {"y", position.y}};
}

void to_json(json &j, const Gauge &gauge) {
    j = json{{"current", gauge.current},
             {"maximum", gauge.maximum}};
}

void to_json(json &j, const Effect &effect) {
    j = json{{"type",   effect.kind == EffectKind::Heal ? "heal" : "damage"},
             {"amount", effect.amount}};
    if (effect.area_of_effect) {
        j["area_of_effect"] = *effect.area_of_effect;
        j["area_shape"] = effect.area_shape == AreaShape::Circle ? "circle" : "square";
    }
}

void to_json(json &j, const Ability &ability) {
    j = json{{"id",          ability.id},
             {"name",        ability.name},
             {"range",       ability.range},
             {"action_cost", ability.action_cost},
             {"mana_cost",   ability.mana_cost},
             {"effect",      ability.effect}};
}

void to_json(json &j, const Hero &hero) {
    j = json{{"id",             hero.id},
             {"owner_id",       hero.owner_id},
             {"name",           hero.name},
             {"position",       hero.position},
             {"start_position", hero.start_position},
             {"hp",             hero.hp},
             {"movement",       hero.movement},
             {"action_points",  hero.action_points},
             {"mana",           hero.mana},
             {"damage",         hero.damage},
             {"armor",          hero.armor},
             {"abilities",      hero.abilities}};
}

void to_json(json &j, const Player &player) {
    j = json{{"player_id", player.player_id},
             {"name",      optional_to_json(player.name)},
             {"connected", player.connected},
             {"heroes",    player.heroes}};
}

void to_json(json &j, const GameState &game_state) {
    json players = json::object();
    for (auto &player: game_state.players)
        players[player.first] = player.second;

    json obstacles = json::array();
    for (auto &position: game_state.obstacles)
        obstacles.push_back(position_key(position));

    j = json{{"game_id",       game_state.game_id},
             {"players",       players},
             {"current_turn",  optional_to_json(game_state.current_turn)},
             {"creator_id",    optional_to_json(game_state.creator_id)},
             {"status",        status_name(game_state.status)},
             {"grid_size",     game_state.grid_size},
             {"obstacles",     obstacles},
             {"moved_hero_id", optional_to_json(game_state.moved_hero_id)},
             {"winner_id",     optional_to_json(game_state.winner_id)},
             {"is_full",       game_state.is_full()}};
}

namespace Serialization {
    static std::string envelope(const std::string &type, const json &payload) {
        return json{{"type",    type},
                    {"payload", payload}}.dump();
    }

    std::string serialize(const Message::GameStateMessage &message) {
        json j{{"type",    Message::GAME_STATE_TYPE},
               {"payload", message.game_state}};
        if (!message.dead_heroes.empty())
            j["dead_heroes"] = message.dead_heroes;
        if (message.winner_id)
            j["winner_id"] = *message.winner_id;
        if (message.winner_name)
            j["winner_name"] = *message.winner_name;
        return j.dump();
    }

    std::string serialize(const Message::ChatMessage &message) {
        return envelope(Message::CHAT_MESSAGE_TYPE, json{{"sender_id",   message.sender_id},
                                                         {"sender_name", message.sender_name},
                                                         {"content",     message.content},
                                                         {"timestamp",   message.timestamp},
                                                         {"channel",     message.channel}});
    }

    std::string serialize(const Message::ErrorMessage &message) {
        return envelope(Message::ERROR_TYPE, json{{"message", message.message}});
    }

    std::string serialize(const Message::MoveHeroMessage &message) {
        return envelope(Message::MOVE_HERO_TYPE, json{{"hero_id",  message.hero_id},
                                                      {"position", message.position}});
    }

    std::string serialize(const Message::UseAbilityMessage &message) {
        json payload{{"hero_id",    message.hero_id},
                     {"ability_id", message.ability_id}};
        if (message.target_position)
            payload["target_position"] = *message.target_position;
        if (message.target_hero_id)
            payload["target_hero_id"] = *message.target_hero_id;
        return envelope(Message::USE_ABILITY_TYPE, payload);
    }

    std::string serialize(const Message::EndTurnMessage &message) {
        return json{{"type",      Message::END_TURN_TYPE},
                    {"game_id",   message.game_id},
                    {"player_id", message.player_id},
                    {"payload",   json::object()}}.dump();
    }

    std::string serialize(const Message::UndoMoveMessage &) {
        return envelope(Message::UNDO_MOVE_TYPE, json::object());
    }

    std::string serialize(const Message::UpdateNameMessage &message) {
        return envelope(Message::UPDATE_NAME_TYPE, json{{"name", message.name}});
    }

    std::string serialize(const Message::StartGameMessage &) {
        return envelope(Message::START_GAME_TYPE, json::object());
    }

    std::string serialize(const Message::SendChatMessage &message) {
        return envelope(Message::CHAT_MESSAGE_TYPE, json{{"content",     message.content},
                                                         {"channel",     message.channel},
                                                         {"player_name", message.player_name}});
    }

    std::string serialize(const Message::ServerMessage &message) {
        return std::visit([](const auto &concrete) { return serialize(concrete); }, message);
    }

    std::string serialize(const Message::ClientMessage &message) {
        return std::visit([](const auto &concrete) { return serialize(concrete); }, message);
    }
}
