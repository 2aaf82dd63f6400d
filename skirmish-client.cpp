#include <unistd.h>

#include <utility>

#include <boost/asio.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <set>
#include <sstream>
#include <string>

#include "connection.hpp"
#include "game_client.hpp"
#include "params_parsing.hpp"
#include "presentation.hpp"
#include "route.hpp"
#include "websocket_transport.hpp"

static const char *HELP_TEXT =
        "commands:\n"
        "  name <name>           set your display name\n"
        "  start                 start the game (creator only)\n"
        "  select <hero_id>      select one of your heroes\n"
        "  ability <ability_id>  select an ability of the selected hero\n"
        "  reachable             cells the selected hero can move to\n"
        "  targets               cells the selected ability can target\n"
        "  area <x> <y>          cells the selected ability would hit\n"
        "  move <x> <y>          move the selected hero\n"
        "  cast <x> <y>          use the selected ability on a cell\n"
        "  cast-hero <hero_id>   use the selected ability on a hero\n"
        "  undo                  undo this turn's move\n"
        "  end                   end your turn\n"
        "  say <text>            global chat\n"
        "  team <text>           chat within this game\n"
        "  quit\n";

static void print_cells(const std::set<Position> &cells) {
    if (cells.empty()) {
        std::cout << "(none)\n";
        return;
    }
    for (auto &cell: cells)
        std::cout << "(" << cell.x << "," << cell.y << ") ";
    std::cout << "\n";
}

static bool read_position(std::istringstream &arguments, Position &position) {
    return static_cast<bool>(arguments >> position.x >> position.y);
}

static std::string rest_of_line(std::istringstream &arguments) {
    std::string rest;
    std::getline(arguments >> std::ws, rest);
    return rest;
}

// Returns false on quit.
static bool execute_command(Client::GameClient &client, Connection::ConnectionManager &connection,
                            const std::string &line) {
    std::istringstream arguments(line);
    std::string command;
    if (!(arguments >> command))
        return true;

    Position position;
    std::string argument;
    if (command == "quit") {
        connection.disconnect();
        return false;
    } else if (command == "help") {
        std::cout << HELP_TEXT;
    } else if (command == "name") {
        client.request_update_name(rest_of_line(arguments));
    } else if (command == "start") {
        client.request_start_game();
    } else if (command == "select" && arguments >> argument) {
        if (!client.select_hero(argument))
            std::cerr << "error: cannot select " << argument << "\n";
    } else if (command == "ability" && arguments >> argument) {
        if (!client.select_ability(argument))
            std::cerr << "error: cannot select ability " << argument << "\n";
    } else if (command == "reachable") {
        print_cells(client.reachable_preview());
    } else if (command == "targets") {
        print_cells(client.ability_targets_preview());
    } else if (command == "area" && read_position(arguments, position)) {
        print_cells(client.area_preview(position));
    } else if (command == "move" && read_position(arguments, position)) {
        client.request_move(position);
    } else if (command == "cast" && read_position(arguments, position)) {
        client.request_ability(position);
    } else if (command == "cast-hero" && arguments >> argument) {
        client.request_ability_on_hero(argument);
    } else if (command == "undo") {
        client.request_undo();
    } else if (command == "end") {
        client.request_end_turn();
    } else if (command == "say") {
        client.send_chat(rest_of_line(arguments), Message::GLOBAL_CHANNEL);
    } else if (command == "team") {
        client.send_chat(rest_of_line(arguments), "game");
    } else {
        std::cerr << "error: unknown command, try help\n";
    }
    return true;
}

// Ends on quit or end of input; the session is closed and the signal wait dropped so that
// io_context runs out of work once the close handshake is done.
static boost::asio::awaitable<void>
input_listener(boost::asio::posix::stream_descriptor *input, boost::asio::signal_set *signals,
               Client::GameClient &client, Connection::ConnectionManager &connection) {
    boost::asio::streambuf buffer;
    try {
        for (;;) {
            size_t read = co_await boost::asio::async_read_until(*input, buffer, '\n',
                                                                 boost::asio::use_awaitable);
            std::string line(boost::asio::buffers_begin(buffer.data()),
                             boost::asio::buffers_begin(buffer.data()) + (std::ptrdiff_t) read - 1);
            buffer.consume(read);
            if (!execute_command(client, connection, line))
                break;
        }
    } catch (boost::system::system_error &e) {
        if (e.code() != boost::asio::error::eof)
            std::cerr << "error: " << e.what() << "\n";
        connection.disconnect();
    }
    signals->cancel();
}

static void skirmish_client(ProgramParams::ProgramParams &program_params) {
    boost::asio::io_context io_context;

    WebSocketTransport::BeastTransport transport(
            io_context, program_params.server_address.host, program_params.server_address.port,
            Route::game_target(program_params.game_id, program_params.player_id));
    Connection::ReconnectPolicy policy;
    policy.base_delay = program_params.base_delay;
    policy.max_retries = program_params.max_retries;
    Connection::ConnectionManager connection(transport,
                                             WebSocketTransport::make_timer_scheduler(io_context),
                                             policy);

    Presentation::ConsoleSink sink(program_params.player_id);
    Client::GameClient client(program_params.game_id, program_params.player_id, connection,
                              sink);

    connection.set_message_handler([&](const std::string &text) {
        client.handle_raw_message(text);
    });
    connection.set_open_handler([&]() {
        std::cout << "Connected to " << program_params.server_address.host << ":"
                  << program_params.server_address.port << "\n";
        if (program_params.player_name)
            client.request_update_name(*program_params.player_name);
    });
    connection.set_terminal_close_handler([&](uint16_t code) {
        if (code == Connection::ROOM_FULL)
            std::cerr << "error: the game is full\n";
        else if (code == Connection::GAME_ENDED)
            std::cerr << "error: the game has ended\n";
        io_context.stop();
    });
    connection.set_give_up_handler([&]() {
        sink.on_connection_lost();
        io_context.stop();
    });

    boost::asio::posix::stream_descriptor input(io_context, ::dup(STDIN_FILENO));

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](auto, auto) { io_context.stop(); });

    connection.connect();
    boost::asio::co_spawn(io_context, input_listener(&input, &signals, client, connection),
                          boost::asio::detached);

    io_context.run();
}

int main(int argc, char **argv) {
    try {
        ProgramParams::ProgramParams program_params = ProgramParams::parse_program_params(argc,
                                                                                          argv);
        skirmish_client(program_params);
    } catch (std::exception &e) {
        std::cerr << "error: " << e.what() << "\n";
        exit(1);
    }
    return 0;
}
