#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "game_state.hpp"
#include "message.hpp"

// Inbound text that is not JSON or does not have the shape of a known message.
struct MalformedMessage : std::runtime_error {
    explicit MalformedMessage(const std::string &message) : std::runtime_error(message) {};
};

void from_json(const nlohmann::json &json, Position &position);

void from_json(const nlohmann::json &json, Gauge &gauge);

void from_json(const nlohmann::json &json, Effect &effect);

void from_json(const nlohmann::json &json, Ability &ability);

void from_json(const nlohmann::json &json, Hero &hero);

void from_json(const nlohmann::json &json, Player &player);

void from_json(const nlohmann::json &json, GameState &game_state);

namespace Deserialization {
    Message::ServerMessage parse_server_message(const std::string &text);

    Message::ClientMessage parse_client_message(const std::string &text);
}
