#pragma once

#include <chrono>
#include <cstdint>

namespace ServerProgramParams {
    struct ServerProgramParams {
        ServerProgramParams(uint16_t port, uint16_t grid_size, uint16_t heroes_per_player,
                            uint16_t obstacle_percent,
                            uint32_t seed = (uint32_t) std::chrono::system_clock::now().time_since_epoch().count())
                : port(port), grid_size(grid_size), heroes_per_player(heroes_per_player),
                  obstacle_percent(obstacle_percent), seed(seed) {};

        uint16_t port;
        uint16_t grid_size;
        uint16_t heroes_per_player;
        uint16_t obstacle_percent;
        uint32_t seed;
    };

    ServerProgramParams parse_program_params(int argc, char **av);
}
