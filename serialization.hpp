#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "game_state.hpp"
#include "message.hpp"

// nlohmann::json looks these up next to the types.
void to_json(nlohmann::json &json, const Position &position);

void to_json(nlohmann::json &json, const Gauge &gauge);

void to_json(nlohmann::json &json, const Effect &effect);

void to_json(nlohmann::json &json, const Ability &ability);

void to_json(nlohmann::json &json, const Hero &hero);

void to_json(nlohmann::json &json, const Player &player);

void to_json(nlohmann::json &json, const GameState &game_state);

namespace Serialization {
    std::string serialize(const Message::GameStateMessage &message);

    std::string serialize(const Message::ChatMessage &message);

    std::string serialize(const Message::ErrorMessage &message);

    std::string serialize(const Message::MoveHeroMessage &message);

    std::string serialize(const Message::UseAbilityMessage &message);

    std::string serialize(const Message::EndTurnMessage &message);

    std::string serialize(const Message::UndoMoveMessage &message);

    std::string serialize(const Message::UpdateNameMessage &message);

    std::string serialize(const Message::StartGameMessage &message);

    std::string serialize(const Message::SendChatMessage &message);

    std::string serialize(const Message::ServerMessage &message);

    std::string serialize(const Message::ClientMessage &message);
}
