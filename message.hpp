#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "game_state.hpp"

namespace Message {
    // Server -> client.
    const std::string GAME_STATE_TYPE = "game_state";
    const std::string CHAT_MESSAGE_TYPE = "chat_message";
    const std::string ERROR_TYPE = "error";

    // Client -> server.
    const std::string MOVE_HERO_TYPE = "move_hero";
    const std::string USE_ABILITY_TYPE = "use_ability";
    const std::string END_TURN_TYPE = "end_turn";
    const std::string UNDO_MOVE_TYPE = "undo_move";
    const std::string UPDATE_NAME_TYPE = "update_name";
    const std::string START_GAME_TYPE = "start_game";

    const std::string GLOBAL_CHANNEL = "global";

    struct GameStateMessage {
        GameState game_state;
        std::vector<Hero> dead_heroes;
        std::optional<player_id_t> winner_id;
        std::optional<std::string> winner_name;
    };

    struct ChatMessage {
        std::string sender_id;
        std::string sender_name;
        std::string content;
        std::string timestamp;
        std::string channel;
    };

    struct ErrorMessage {
        std::string message;
    };

    struct MoveHeroMessage {
        hero_id_t hero_id;
        Position position;
    };

    // Exactly one of target_position and target_hero_id is set.
    struct UseAbilityMessage {
        hero_id_t hero_id;
        ability_id_t ability_id;
        std::optional<Position> target_position;
        std::optional<hero_id_t> target_hero_id;
    };

    struct EndTurnMessage {
        std::string game_id;
        player_id_t player_id;
    };

    struct UndoMoveMessage {
    };

    struct UpdateNameMessage {
        std::string name;
    };

    struct StartGameMessage {
    };

    struct SendChatMessage {
        std::string content;
        std::string channel;
        std::string player_name;
    };

    using ServerMessage = std::variant<GameStateMessage, ChatMessage, ErrorMessage>;

    using ClientMessage = std::variant<MoveHeroMessage, UseAbilityMessage, EndTurnMessage,
            UndoMoveMessage, UpdateNameMessage, StartGameMessage, SendChatMessage>;
}
