#pragma once

#include <optional>
#include <string>

namespace Route {
    struct GameRoute {
        std::string game_id;
        std::string player_id;
    };

    // "/ws/game/{game_id}/player/{player_id}"
    std::string game_target(const std::string &game_id, const std::string &player_id);

    std::optional<GameRoute> parse_game_target(const std::string &target);
}
