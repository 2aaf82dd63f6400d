#include "setup.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "grid.hpp"

namespace Setup {
    static Ability make_ability(const ability_id_t &id, const std::string &name, int32_t range,
                                int32_t action_cost, int32_t mana_cost, EffectKind kind,
                                int32_t amount) {
        Ability ability;
        ability.id = id;
        ability.name = name;
        ability.range = range;
        ability.action_cost = action_cost;
        ability.mana_cost = mana_cost;
        ability.effect.kind = kind;
        ability.effect.amount = amount;
        return ability;
    }

    std::vector<Ability> default_abilities(int32_t hero_damage) {
        std::vector<Ability> abilities;
        abilities.push_back(make_ability("damage_1", "Strike", 1, 1, 0, EffectKind::Damage,
                                         hero_damage));
        abilities.push_back(make_ability("ranged_1", "Arrow", 4, 2, 0, EffectKind::Damage, 3));
        abilities.push_back(make_ability("heal_1", "Mend", 3, 1, 2, EffectKind::Heal, 4));
        Ability fireball = make_ability("explosion_1", "Fireball", 4, 2, 5, EffectKind::Damage, 4);
        fireball.effect.area_of_effect = 1;
        fireball.effect.area_shape = AreaShape::Circle;
        abilities.push_back(fireball);
        return abilities;
    }

    Hero make_hero(const player_id_t &owner_id, size_t index, const Position &position) {
        Hero hero;
        hero.id = owner_id + "_hero_" + std::to_string(index);
        hero.owner_id = owner_id;
        hero.name = "Hero " + std::to_string(index + 1);
        hero.position = position;
        hero.start_position = position;
        hero.hp = Gauge(HERO_HP);
        hero.movement = Gauge(HERO_MOVEMENT);
        hero.action_points = Gauge(HERO_ACTION_POINTS);
        hero.mana = Gauge(HERO_MANA);
        hero.damage = HERO_DAMAGE;
        hero.armor = HERO_ARMOR;
        hero.abilities = default_abilities(HERO_DAMAGE);
        return hero;
    }

    void generate_obstacles(GameState &game_state, RandomNumberGenerator &random_number_generator,
                            const BoardSettings &settings) {
        game_state.obstacles.clear();
        coordinate_t size = game_state.grid_size;
        coordinate_t first_row = SPAWN_ROWS;
        coordinate_t last_row = size - SPAWN_ROWS - 1;
        if (first_row > last_row)
            return;

        uint32_t available_cells = (uint32_t) (size * (last_row - first_row + 1));
        uint32_t obstacles_count = available_cells * settings.obstacle_percent / 100;
        uint32_t max_attempts = obstacles_count * 3;
        for (uint32_t attempts = 0;
             attempts < max_attempts && game_state.obstacles.size() < obstacles_count; ++attempts) {
            Position position(random_number_generator.between(0, size - 1),
                              random_number_generator.between(first_row, last_row));
            game_state.obstacles.insert(position);
        }
        std::cout << "[" << game_state.game_id << "] generated " << game_state.obstacles.size()
                  << " obstacles\n";
    }

    void place_heroes(GameState &game_state, RandomNumberGenerator &random_number_generator,
                      const BoardSettings &settings) {
        const uint32_t max_attempts = 100;
        coordinate_t size = game_state.grid_size;
        Grid::GridModel grid(size, game_state.obstacles);

        for (auto &player_pair: game_state.players) {
            Player &player = player_pair.second;
            bool top_player = game_state.creator_id && *game_state.creator_id == player.player_id;
            coordinate_t first_row = top_player ? 0 : std::max(0, size - SPAWN_ROWS);
            coordinate_t last_row = top_player ? std::min(size, SPAWN_ROWS) - 1 : size - 1;

            player.heroes.clear();
            for (uint32_t attempts = 0;
                 attempts < max_attempts && player.heroes.size() < settings.heroes_per_player;
                 ++attempts) {
                Position position(random_number_generator.between(0, size - 1),
                                  random_number_generator.between(first_row, last_row));
                if (grid.is_obstacle(position) || grid.hero_at(position))
                    continue;
                Hero hero = make_hero(player.player_id, player.heroes.size(), position);
                grid.place_hero(hero.id, position);
                player.heroes.push_back(hero);
            }

            if (player.heroes.size() < settings.heroes_per_player)
                throw std::runtime_error("Could not place all heroes for player " +
                                         player.player_id);
        }
    }
}
