#include "chat_log.hpp"

#include <chrono>
#include <ctime>

namespace Authority {
    std::string ChatLog::scope_of(const std::string &game_id, const std::string &channel) {
        if (channel == Message::GLOBAL_CHANNEL)
            return Message::GLOBAL_CHANNEL;
        return game_id + "/" + channel;
    }

    void ChatLog::append(const std::string &game_id, const Message::ChatMessage &message) {
        auto &messages = scopes[scope_of(game_id, message.channel)];
        messages.push_back(message);
        while (messages.size() > CHAT_HISTORY_LIMIT)
            messages.pop_front();
    }

    const std::deque<Message::ChatMessage> &ChatLog::history(const std::string &scope) const {
        static const std::deque<Message::ChatMessage> empty;
        auto it = scopes.find(scope);
        if (it == scopes.end())
            return empty;
        return it->second;
    }

    void ChatLog::drop_game(const std::string &game_id) {
        std::string prefix = game_id + "/";
        for (auto it = scopes.begin(); it != scopes.end();) {
            if (it->first.compare(0, prefix.size(), prefix) == 0)
                it = scopes.erase(it);
            else
                ++it;
        }
    }

    std::vector<Message::ChatMessage> ChatLog::history_for_game(const std::string &game_id) const {
        std::vector<Message::ChatMessage> messages;
        auto &global = history(Message::GLOBAL_CHANNEL);
        messages.insert(messages.end(), global.begin(), global.end());
        std::string prefix = game_id + "/";
        for (auto &scope: scopes) {
            if (scope.first.compare(0, prefix.size(), prefix) == 0)
                messages.insert(messages.end(), scope.second.begin(), scope.second.end());
        }
        return messages;
    }

    std::string current_timestamp() {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm utc{};
        gmtime_r(&now, &utc);
        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
        return buffer;
    }
}
