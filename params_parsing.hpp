#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ProgramParams {
    const std::string DEFAULT_SERVER_PORT = "8000";

    struct AddressPair {
        std::string host;
        std::string port;
    };

    struct ProgramParams {
        ProgramParams(AddressPair server_address, std::string game_id, std::string player_id,
                      std::optional<std::string> player_name, uint32_t max_retries,
                      std::chrono::milliseconds base_delay) :
                server_address(server_address), game_id(game_id), player_id(player_id),
                player_name(player_name), max_retries(max_retries), base_delay(base_delay) {};

        AddressPair server_address;
        std::string game_id;
        std::string player_id;
        std::optional<std::string> player_name;
        uint32_t max_retries;
        std::chrono::milliseconds base_delay;
    };

    // host[:port], host may be a bracketed IPv6 address.
    AddressPair parse_server_address(const std::string &address_spec,
                                     const std::string &default_service = DEFAULT_SERVER_PORT);

    ProgramParams parse_program_params(int argc, char **av);
}
