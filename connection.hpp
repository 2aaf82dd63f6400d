#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>
#include <string>

namespace Connection {
    enum class State {
        Disconnected,
        Connecting,
        Connected
    };

    const uint16_t NORMAL_CLOSURE = 1000;
    const uint16_t ABNORMAL_CLOSURE = 1006;
    const uint16_t ROOM_FULL = 4000;
    const uint16_t GAME_ENDED = 4001;

    // Terminal codes end the session; anything else is worth a reconnect.
    inline bool is_terminal_close(uint16_t code) {
        return code == NORMAL_CLOSURE || code == ROOM_FULL || code == GAME_ENDED;
    }

    struct ReconnectPolicy {
        std::chrono::milliseconds base_delay{1000};
        uint32_t max_retries = 3;
        std::chrono::milliseconds max_delay{60000};

        // attempt is 1-based: 2 s, 4 s, 8 s with the defaults. Never more than max_delay.
        std::chrono::milliseconds delay_for(uint32_t attempt) const {
            std::chrono::milliseconds delay = base_delay;
            for (uint32_t i = 0; i < attempt && delay.count() > 0 && delay < max_delay; ++i)
                delay *= 2;
            return std::min(delay, max_delay);
        }
    };

    struct TransportEvents {
        virtual void on_transport_open() = 0;

        virtual void on_transport_message(const std::string &text) = 0;

        virtual void on_transport_closed(uint16_t code) = 0;
    };

    // One connection attempt per open(). Every attempt ends with exactly one
    // on_transport_closed, whether it opened or not, unless close() ended it first: after
    // close() the attempt reports nothing.
    struct Transport {
        virtual ~Transport() {}

        virtual void attach(TransportEvents *events) = 0;

        virtual void open() = 0;

        virtual void send(const std::string &text) = 0;

        virtual void close(uint16_t code) = 0;
    };

    using Scheduler = std::function<void(std::chrono::milliseconds, std::function<void()>)>;

    class ConnectionManager : public TransportEvents {
    public:
        ConnectionManager(Transport &transport, Scheduler scheduler,
                          ReconnectPolicy policy = ReconnectPolicy());

        void connect();

        // Intentional close with code 1000; the session stays down.
        void disconnect();

        // Rejected unless connected. Nothing is queued.
        bool send(const std::string &text);

        State state() const {
            return current_state;
        }

        uint32_t retry_count() const {
            return retries;
        }

        void set_message_handler(std::function<void(const std::string &)> handler) {
            message_handler = std::move(handler);
        }

        void set_open_handler(std::function<void()> handler) {
            open_handler = std::move(handler);
        }

        void set_terminal_close_handler(std::function<void(uint16_t)> handler) {
            terminal_close_handler = std::move(handler);
        }

        void set_give_up_handler(std::function<void()> handler) {
            give_up_handler = std::move(handler);
        }

        void on_transport_open() override;

        void on_transport_message(const std::string &text) override;

        void on_transport_closed(uint16_t code) override;

    private:
        void open_transport();

        void schedule_retry();

        Transport &transport;
        Scheduler scheduler;
        ReconnectPolicy policy;
        State current_state = State::Disconnected;
        uint32_t retries = 0;
        // Bumped by connect() and disconnect() so that retries scheduled earlier are dropped.
        uint64_t generation = 0;
        bool stopped = false;

        std::function<void(const std::string &)> message_handler;
        std::function<void()> open_handler;
        std::function<void(uint16_t)> terminal_close_handler;
        std::function<void()> give_up_handler;
    };
}
