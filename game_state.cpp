#include "game_state.hpp"

#include <algorithm>
#include <cstdlib>

std::string position_key(const Position &position) {
    return std::to_string(position.x) + "," + std::to_string(position.y);
}

Position position_from_key(const std::string &key) {
    size_t delimiter_index = key.find(',');
    if (delimiter_index == std::string::npos)
        throw std::invalid_argument("Invalid position key: " + key);
    return Position((coordinate_t) std::stoi(key.substr(0, delimiter_index)),
                    (coordinate_t) std::stoi(key.substr(delimiter_index + 1)));
}

coordinate_t manhattan_distance(const Position &a, const Position &b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

coordinate_t chebyshev_distance(const Position &a, const Position &b) {
    return std::max(std::abs(a.x - b.x), std::abs(a.y - b.y));
}

const Ability *Hero::find_ability(const ability_id_t &ability_id) const {
    for (auto &ability: abilities) {
        if (ability.id == ability_id)
            return &ability;
    }
    return nullptr;
}

size_t Player::alive_count() const {
    size_t count = 0;
    for (auto &hero: heroes) {
        if (hero.alive())
            count++;
    }
    return count;
}

std::string status_name(GameStatus status) {
    switch (status) {
        case GameStatus::Lobby:
            return "lobby";
        case GameStatus::InProgress:
            return "in_progress";
        case GameStatus::GameOver:
            return "game_over";
    }
    return "lobby";
}

std::optional<GameStatus> status_from_name(const std::string &name) {
    if (name == "lobby")
        return GameStatus::Lobby;
    if (name == "in_progress")
        return GameStatus::InProgress;
    if (name == "game_over")
        return GameStatus::GameOver;
    return std::nullopt;
}

Hero *GameState::find_hero(const hero_id_t &hero_id) {
    for (auto &player: players) {
        for (auto &hero: player.second.heroes) {
            if (hero.id == hero_id)
                return &hero;
        }
    }
    return nullptr;
}

const Hero *GameState::find_hero(const hero_id_t &hero_id) const {
    for (auto &player: players) {
        for (auto &hero: player.second.heroes) {
            if (hero.id == hero_id)
                return &hero;
        }
    }
    return nullptr;
}

Player *GameState::find_player(const player_id_t &player_id) {
    auto it = players.find(player_id);
    if (it == players.end())
        return nullptr;
    return &it->second;
}

const Player *GameState::find_player(const player_id_t &player_id) const {
    auto it = players.find(player_id);
    if (it == players.end())
        return nullptr;
    return &it->second;
}

std::optional<player_id_t> GameState::other_player(const player_id_t &player_id) const {
    for (auto &player: players) {
        if (player.first != player_id)
            return player.first;
    }
    return std::nullopt;
}

std::vector<const Hero *> GameState::all_heroes() const {
    std::vector<const Hero *> heroes;
    for (auto &player: players) {
        for (auto &hero: player.second.heroes)
            heroes.push_back(&hero);
    }
    return heroes;
}
