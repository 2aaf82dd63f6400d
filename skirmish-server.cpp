#include <utility>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/lexical_cast.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include "chat_log.hpp"
#include "connection.hpp"
#include "deserialization.hpp"
#include "game_room.hpp"
#include "route.hpp"
#include "serialization.hpp"
#include "server_params_parsing.hpp"

using boost::asio::awaitable;
using boost::asio::use_awaitable;
using boost::asio::detached;
using boost::asio::co_spawn;
using batcp = boost::asio::ip::tcp;

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;

using websocket_stream = websocket::stream<beast::tcp_stream>;

struct Server {
    ServerProgramParams::ServerProgramParams params;
    std::map<std::string, std::unique_ptr<Authority::GameRoom>> rooms;
    // game id -> player id -> open socket
    std::map<std::string, std::map<player_id_t, websocket_stream *>> sockets;
    Authority::ChatLog chat_log;
    uint32_t rooms_created = 0;

    explicit Server(const ServerProgramParams::ServerProgramParams &params) : params(params) {};

    Authority::GameRoom &room_for(const std::string &game_id) {
        auto it = rooms.find(game_id);
        if (it != rooms.end())
            return *it->second;
        Setup::BoardSettings settings;
        settings.heroes_per_player = params.heroes_per_player;
        settings.obstacle_percent = params.obstacle_percent;
        // Every room gets its own generator; the whole server replays from one seed.
        auto room = std::make_unique<Authority::GameRoom>(game_id,
                                                          (coordinate_t) params.grid_size,
                                                          settings, params.seed + rooms_created++);
        std::cout << "[" << game_id << "] room created\n";
        return *rooms.emplace(game_id, std::move(room)).first->second;
    }

    void free_room(const std::string &game_id) {
        rooms.erase(game_id);
        sockets.erase(game_id);
        chat_log.drop_game(game_id);
        std::cout << "[" << game_id << "] room freed\n";
    }

    void send_text(websocket_stream *ws, const std::string &text) {
        beast::error_code error;
        ws->write(boost::asio::buffer(text), error);
        if (error)
            std::cerr << "error: send failed: " << error.message() << "\n";
    }

    void send_to_game(const std::string &game_id, const std::string &text) {
        auto it = sockets.find(game_id);
        if (it == sockets.end())
            return;
        for (auto &socket: it->second)
            send_text(socket.second, text);
    }

    void send_to_all(const std::string &text) {
        for (auto &game: sockets) {
            for (auto &socket: game.second)
                send_text(socket.second, text);
        }
    }

    void broadcast_state(Authority::GameRoom &room, const Authority::Outcome &outcome) {
        send_to_game(room.state().game_id, Serialization::serialize(room.snapshot(outcome)));
    }

    void relay_chat(const std::string &game_id, const Message::ChatMessage &message) {
        chat_log.append(game_id, message);
        std::string text = Serialization::serialize(message);
        if (message.channel == Message::GLOBAL_CHANNEL)
            send_to_all(text);
        else
            send_to_game(game_id, text);
    }

    void handle_text(Authority::GameRoom &room, const player_id_t &player_id, websocket_stream *ws,
                     const std::string &text) {
        Message::ClientMessage message;
        try {
            message = Deserialization::parse_client_message(text);
        } catch (MalformedMessage &e) {
            std::cerr << "error: [" << room.state().game_id << "] malformed message from "
                      << player_id << ": " << e.what() << "\n";
            send_text(ws, Serialization::serialize(
                    Message::ErrorMessage{"Error processing message"}));
            return;
        }

        Authority::Outcome outcome = room.handle(player_id, message);
        if (outcome.error)
            send_text(ws, Serialization::serialize(*outcome.error));
        if (outcome.broadcast_state)
            broadcast_state(room, outcome);
        if (outcome.chat)
            relay_chat(room.state().game_id, *outcome.chat);
    }

    awaitable<void> reject_request(websocket_stream &ws,
                                   const http::request<http::string_body> &request) {
        http::response<http::string_body> response{http::status::not_found, request.version()};
        response.set(http::field::content_type, "text/plain");
        response.body() = "Unknown endpoint\n";
        response.prepare_payload();
        co_await http::async_write(ws.next_layer(), response, use_awaitable);
    }

    awaitable<void> single_client_listener(batcp::socket socket) {
        socket.set_option(batcp::no_delay(true));
        std::string address = boost::lexical_cast<std::string>(socket.remote_endpoint());
        websocket_stream ws(std::move(socket));

        beast::flat_buffer buffer;
        http::request<http::string_body> request;
        co_await http::async_read(ws.next_layer(), buffer, request, use_awaitable);
        auto route = Route::parse_game_target(std::string(request.target()));
        if (!websocket::is_upgrade(request) || !route) {
            std::cerr << "error: bad request from " << address << "\n";
            co_await reject_request(ws, request);
            co_return;
        }

        beast::get_lowest_layer(ws).expires_never();
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        co_await ws.async_accept(request, use_awaitable);
        ws.text(true);

        Authority::GameRoom &room = room_for(route->game_id);
        Authority::JoinResult result = room.join(route->player_id);
        if (result == Authority::JoinResult::RoomFull) {
            co_await ws.async_close(websocket::close_reason(Connection::ROOM_FULL), use_awaitable);
            co_return;
        }
        if (result == Authority::JoinResult::GameEnded) {
            co_await ws.async_close(websocket::close_reason(Connection::GAME_ENDED),
                                    use_awaitable);
            co_return;
        }

        auto &game_sockets = sockets[route->game_id];
        auto previous = game_sockets.find(route->player_id);
        if (previous != game_sockets.end()) {
            // Same player from a new socket; the old one is closed.
            previous->second->async_close(websocket::close_reason(Connection::NORMAL_CLOSURE),
                                          [](beast::error_code) {});
        }
        game_sockets[route->player_id] = &ws;
        std::cout << "[" << route->game_id << "] " << route->player_id << " connected from "
                  << address << "\n";

        broadcast_state(room, Authority::Outcome());
        for (auto &message: chat_log.history_for_game(route->game_id))
            send_text(&ws, Serialization::serialize(message));

        try {
            for (;;) {
                beast::flat_buffer message_buffer;
                co_await ws.async_read(message_buffer, use_awaitable);
                handle_text(room, route->player_id, &ws,
                            beast::buffers_to_string(message_buffer.data()));
            }
        } catch (boost::system::system_error &e) {
            if (e.code() != websocket::error::closed)
                std::cerr << "error: [" << route->game_id << "] " << route->player_id << ": "
                          << e.what() << "\n";
        }

        auto current = sockets[route->game_id].find(route->player_id);
        if (current != sockets[route->game_id].end() && current->second == &ws) {
            sockets[route->game_id].erase(current);
            if (room.leave(route->player_id))
                broadcast_state(room, Authority::Outcome());
            if (room.is_abandoned())
                free_room(route->game_id);
        }
        co_return;
    }

    awaitable<void> guarded_client_listener(batcp::socket socket) {
        try {
            co_await single_client_listener(std::move(socket));
        } catch (std::exception &e) {
            std::cerr << "error: " << e.what() << "\n";
        }
    }

    awaitable<void> connections_listener() {
        auto executor = co_await
        boost::asio::this_coro::executor;
        batcp::acceptor acceptor(executor, {batcp::v6(), params.port});
        for (;;) {
            batcp::socket socket =
                    co_await
            acceptor.async_accept(use_awaitable);

            co_spawn(executor,
                     guarded_client_listener(std::move(socket)),
                     detached);
        }
        co_return;
    }

    void run() {
        boost::asio::io_context io_context(1);

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](auto, auto) { io_context.stop(); });

        co_spawn(io_context, connections_listener(), detached);

        io_context.run();
    }
};

int main(int argc, char **argv) {
    try {
        ServerProgramParams::ServerProgramParams program_params =
                ServerProgramParams::parse_program_params(argc, argv);
        std::cout << "skirmish-server listening on port " << program_params.port << ", seed "
                  << program_params.seed << "\n";

        Server server(program_params);
        server.run();
    } catch (std::exception &e) {
        std::cerr << "error: " << e.what() << "\n";
        exit(1);
    }
    return 0;
}
