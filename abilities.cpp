#include "abilities.hpp"

#include <algorithm>

#include "grid.hpp"
#include "path_finding.hpp"
#include "turn.hpp"

namespace Abilities {
    bool in_range(const GameState &game_state, const Hero &caster, const Ability &ability,
                  const Position &target) {
        Grid::GridModel grid(game_state);
        auto path = PathFinding::find_path(grid, caster.position, target, ability.range, true,
                                           caster.id);
        return path && (int32_t) PathFinding::path_length(*path) <= ability.range;
    }

    static std::optional<std::string> usage_error(const GameState &game_state, const Hero &caster,
                                                  const Ability &ability, const Position &target) {
        if (game_state.status != GameStatus::InProgress)
            return "Game is not in progress";
        if (!game_state.current_turn || *game_state.current_turn != caster.owner_id)
            return "Not your turn";
        if (!caster.alive())
            return "Hero is dead";
        if (caster.action_points.current < ability.action_cost)
            return "Not enough action points";
        if (caster.mana.current < ability.mana_cost)
            return "Not enough mana";
        if (target.x < 0 || target.y < 0 || target.x >= game_state.grid_size ||
            target.y >= game_state.grid_size)
            return "Target out of bounds";
        if (!in_range(game_state, caster, ability, target))
            return "Target out of range";
        return std::nullopt;
    }

    bool can_use_ability(const GameState &game_state, const Hero &caster, const Ability &ability,
                         const Position &target) {
        return !usage_error(game_state, caster, ability, target).has_value();
    }

    std::set<Position> valid_targets(const GameState &game_state, const Hero &caster,
                                     const Ability &ability) {
        std::set<Position> targets;
        for (coordinate_t dy = -ability.range; dy <= ability.range; ++dy) {
            for (coordinate_t dx = -ability.range; dx <= ability.range; ++dx) {
                Position candidate(caster.position.x + dx, caster.position.y + dy);
                if (manhattan_distance(caster.position, candidate) > ability.range)
                    continue;
                if (can_use_ability(game_state, caster, ability, candidate))
                    targets.insert(candidate);
            }
        }
        return targets;
    }

    std::set<Position> resolve_affected_cells(coordinate_t grid_size, const Position &target,
                                              const Ability &ability) {
        Grid::GridModel grid(grid_size, {});
        std::set<Position> cells;
        if (!ability.effect.area_of_effect) {
            if (grid.is_in_bounds(target))
                cells.insert(target);
            return cells;
        }

        int32_t radius = *ability.effect.area_of_effect;
        for (coordinate_t dy = -radius; dy <= radius; ++dy) {
            for (coordinate_t dx = -radius; dx <= radius; ++dx) {
                Position cell(target.x + dx, target.y + dy);
                if (!grid.is_in_bounds(cell))
                    continue;
                coordinate_t distance = ability.effect.area_shape == AreaShape::Circle
                                        ? manhattan_distance(target, cell)
                                        : chebyshev_distance(target, cell);
                if (distance <= radius)
                    cells.insert(cell);
            }
        }
        return cells;
    }

    int32_t damage_after_armor(int32_t amount, int32_t armor) {
        return std::max(0, amount - armor);
    }

    static void apply_effect(const Effect &effect, Hero &hero) {
        if (effect.kind == EffectKind::Heal) {
            hero.hp.current = std::min(hero.hp.maximum, hero.hp.current + effect.amount);
        } else {
            int32_t damage = damage_after_armor(effect.amount, hero.armor);
            hero.hp.current = std::max(0, hero.hp.current - damage);
        }
    }

    static std::vector<Hero> remove_dead_heroes(GameState &game_state) {
        std::vector<Hero> dead_heroes;
        for (auto &player: game_state.players) {
            auto &heroes = player.second.heroes;
            for (auto &hero: heroes) {
                if (!hero.alive())
                    dead_heroes.push_back(hero);
            }
            heroes.erase(std::remove_if(heroes.begin(), heroes.end(),
                                        [](const Hero &hero) { return !hero.alive(); }),
                         heroes.end());
        }
        return dead_heroes;
    }

    Resolution apply_ability(GameState &game_state, const hero_id_t &caster_id,
                             const ability_id_t &ability_id, const Position &target) {
        const Hero *caster = game_state.find_hero(caster_id);
        if (caster == nullptr)
            throw IllegalIntent("Hero not found");
        const Ability *found = caster->find_ability(ability_id);
        if (found == nullptr)
            throw IllegalIntent("Ability not found");
        // Copies: the caster may be removed from play by its own area effect.
        Ability ability = *found;
        player_id_t acting_player = caster->owner_id;
        if (auto error = usage_error(game_state, *caster, ability, target))
            throw IllegalIntent(*error);

        Resolution resolution;
        Grid::GridModel grid(game_state);
        for (auto &cell: resolve_affected_cells(game_state.grid_size, target, ability)) {
            auto hero_id = grid.hero_at(cell);
            if (!hero_id)
                continue;
            Hero *hero = game_state.find_hero(*hero_id);
            apply_effect(ability.effect, *hero);
            resolution.affected_heroes.push_back(*hero_id);
        }

        // Every death of this resolution is settled before the win condition is looked at.
        resolution.dead_heroes = remove_dead_heroes(game_state);

        if (Hero *surviving_caster = game_state.find_hero(caster_id)) {
            surviving_caster->action_points.current -= ability.action_cost;
            surviving_caster->mana.current -= ability.mana_cost;
        }

        resolution.winner_id = Turn::check_win_condition(game_state, acting_player);
        return resolution;
    }
}
