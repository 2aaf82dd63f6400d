#pragma once

#include <cstdint>
#include <vector>

#include "game_state.hpp"

namespace Setup {
    //r_0 = (seed * 48271) mod 2147483647
    //r_i = (r_{i-1} * 48271) mod 2147483647
    struct RandomNumberGenerator {
        RandomNumberGenerator(uint32_t seed) : last_number(seed % 2147483647 == 0 ? 1 : seed) {};
        uint32_t last_number;

        uint32_t generate() {
            last_number = (uint32_t) (((uint64_t) last_number * 48271) % 2147483647);
            return last_number;
        }

        // Uniform enough for board generation; inclusive bounds.
        coordinate_t between(coordinate_t low, coordinate_t high) {
            return low + (coordinate_t) (generate() % (uint32_t) (high - low + 1));
        }
    };

    struct BoardSettings {
        uint16_t heroes_per_player = 4;
        uint16_t obstacle_percent = 15;
    };

    // Rows at the top and at the bottom of the board kept free of obstacles for spawning.
    const coordinate_t SPAWN_ROWS = 4;

    const int32_t HERO_HP = 10;
    const int32_t HERO_MOVEMENT = 5;
    const int32_t HERO_ACTION_POINTS = 3;
    const int32_t HERO_MANA = 10;
    const int32_t HERO_DAMAGE = 5;
    const int32_t HERO_ARMOR = 1;

    std::vector<Ability> default_abilities(int32_t hero_damage);

    Hero make_hero(const player_id_t &owner_id, size_t index, const Position &position);

    void generate_obstacles(GameState &game_state, RandomNumberGenerator &random_number_generator,
                            const BoardSettings &settings);

    // The creator spawns in the top rows, the opponent in the bottom rows.
    void place_heroes(GameState &game_state, RandomNumberGenerator &random_number_generator,
                      const BoardSettings &settings);
}
