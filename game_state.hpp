#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using player_id_t = std::string;
using hero_id_t = std::string;
using ability_id_t = std::string;
using coordinate_t = int32_t;

// Rejected movement, ability or turn intent. Nothing has been mutated when it is thrown.
struct IllegalIntent : std::runtime_error {
    explicit IllegalIntent(const std::string &message) : std::runtime_error(message) {};
};

struct Position {
    Position() {}

    Position(coordinate_t x, coordinate_t y) : x(x), y(y) {};
    coordinate_t x = 0;
    coordinate_t y = 0;

    bool operator<(const Position &position) const {
        return this->x < position.x || (this->x == position.x && this->y < position.y);
    }

    bool operator==(const Position &position) const {
        return this->x == position.x && this->y == position.y;
    }

    bool operator!=(const Position &position) const {
        return !(*this == position);
    }
};

// "x,y", the form obstacles travel in.
std::string position_key(const Position &position);

Position position_from_key(const std::string &key);

coordinate_t manhattan_distance(const Position &a, const Position &b);

coordinate_t chebyshev_distance(const Position &a, const Position &b);

struct Gauge {
    Gauge() {}

    Gauge(int32_t maximum) : current(maximum), maximum(maximum) {};

    Gauge(int32_t current, int32_t maximum) : current(current), maximum(maximum) {};
    int32_t current = 0;
    int32_t maximum = 0;

    void refill() {
        current = maximum;
    }
};

enum class EffectKind {
    Heal,
    Damage
};

enum class AreaShape {
    Circle, // Manhattan radius
    Square  // Chebyshev radius
};

struct Effect {
    EffectKind kind = EffectKind::Damage;
    int32_t amount = 0;
    std::optional<int32_t> area_of_effect;
    AreaShape area_shape = AreaShape::Circle;
};

struct Ability {
    ability_id_t id;
    std::string name;
    int32_t range = 0;
    int32_t action_cost = 0;
    int32_t mana_cost = 0;
    Effect effect;
};

struct Hero {
    hero_id_t id;
    player_id_t owner_id;
    std::string name;
    Position position;
    Position start_position;
    Gauge hp;
    Gauge movement;
    Gauge action_points;
    Gauge mana;
    int32_t damage = 0;
    int32_t armor = 0;
    std::vector<Ability> abilities;

    bool alive() const {
        return hp.current > 0;
    }

    const Ability *find_ability(const ability_id_t &ability_id) const;
};

struct Player {
    Player() {}

    Player(player_id_t player_id) : player_id(player_id) {};
    player_id_t player_id;
    std::optional<std::string> name;
    bool connected = false;
    std::vector<Hero> heroes;

    size_t alive_count() const;
};

using PlayersMap = std::map<player_id_t, Player>;

enum class GameStatus {
    Lobby,
    InProgress,
    GameOver
};

std::string status_name(GameStatus status);

std::optional<GameStatus> status_from_name(const std::string &name);

const size_t MAX_PLAYERS = 2;

struct GameState {
    GameState() {}

    GameState(std::string game_id) : game_id(game_id) {};
    std::string game_id;
    PlayersMap players;
    std::optional<player_id_t> current_turn;
    std::optional<player_id_t> creator_id;
    GameStatus status = GameStatus::Lobby;
    coordinate_t grid_size = 20;
    std::set<Position> obstacles;
    std::optional<hero_id_t> moved_hero_id;
    std::optional<player_id_t> winner_id;

    bool is_full() const {
        return players.size() >= MAX_PLAYERS;
    }

    Hero *find_hero(const hero_id_t &hero_id);

    const Hero *find_hero(const hero_id_t &hero_id) const;

    Player *find_player(const player_id_t &player_id);

    const Player *find_player(const player_id_t &player_id) const;

    std::optional<player_id_t> other_player(const player_id_t &player_id) const;

    std::vector<const Hero *> all_heroes() const;
};
