#pragma once

#include <memory>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "connection.hpp"

namespace WebSocketTransport {
    using websocket_stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    // Client side of /ws/game/{game_id}/player/{player_id}.
    class BeastTransport : public Connection::Transport {
    public:
        BeastTransport(boost::asio::io_context &io_context, std::string host, std::string port,
                       std::string target)
                : io_context(io_context), host(std::move(host)), port(std::move(port)),
                  target(std::move(target)) {};

        void attach(Connection::TransportEvents *transport_events) override {
            events = transport_events;
        }

        void open() override;

        void send(const std::string &text) override;

        void close(uint16_t code) override;

    private:
        boost::asio::awaitable<void> run(std::shared_ptr<websocket_stream> stream);

        boost::asio::io_context &io_context;
        std::string host;
        std::string port;
        std::string target;
        Connection::TransportEvents *events = nullptr;
        std::shared_ptr<websocket_stream> current;
    };

    // Runs delayed callbacks on the io_context with steady_timer.
    Connection::Scheduler make_timer_scheduler(boost::asio::io_context &io_context);
}
