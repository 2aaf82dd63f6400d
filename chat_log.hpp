#pragma once

#include <deque>
#include <map>
#include <string>
#include <vector>

#include "message.hpp"

namespace Authority {
    const size_t CHAT_HISTORY_LIMIT = 100;

    // Last CHAT_HISTORY_LIMIT messages per scope. The global channel has one scope shared by
    // every game; any other channel is scoped to its game.
    class ChatLog {
    public:
        static std::string scope_of(const std::string &game_id, const std::string &channel);

        void append(const std::string &game_id, const Message::ChatMessage &message);

        const std::deque<Message::ChatMessage> &history(const std::string &scope) const;

        // Forgets every channel of game_id. The global scope is kept.
        void drop_game(const std::string &game_id);

        // Global history followed by every channel of game_id.
        std::vector<Message::ChatMessage> history_for_game(const std::string &game_id) const;

    private:
        std::map<std::string, std::deque<Message::ChatMessage>> scopes;
    };

    // UTC, ISO 8601.
    std::string current_timestamp();
}
