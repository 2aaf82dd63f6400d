#include "presentation.hpp"

#include <iostream>
#include <map>

namespace Presentation {
    std::string ability_cue(const ability_id_t &ability_id) {
        static const std::map<ability_id_t, std::string> cues = {
                {"heal_1",      "heal"},
                {"damage_1",    "punch"},
                {"ranged_1",    "bow"},
                {"explosion_1", "explosion"}};
        auto it = cues.find(ability_id);
        if (it == cues.end())
            return "damage";
        return it->second;
    }

    // '#' obstacle, '.' free, owner's heroes as digits, the opponent's as letters.
    std::vector<std::string> render_board(const GameState &game_state) {
        std::vector<std::string> rows((size_t) game_state.grid_size,
                                      std::string((size_t) game_state.grid_size, '.'));
        for (auto &position: game_state.obstacles) {
            if (0 <= position.x && position.x < game_state.grid_size && 0 <= position.y &&
                position.y < game_state.grid_size)
                rows[position.y][position.x] = '#';
        }
        char side = '0';
        for (auto &player: game_state.players) {
            for (size_t i = 0; i < player.second.heroes.size(); ++i) {
                auto &position = player.second.heroes[i].position;
                if (0 <= position.x && position.x < game_state.grid_size && 0 <= position.y &&
                    position.y < game_state.grid_size)
                    rows[position.y][position.x] = (char) ((side == '0' ? '1' : 'a') + i % 9);
            }
            side = 'a';
        }
        return rows;
    }

    void ConsoleSink::on_snapshot(const GameState &game_state) {
        std::cout << "[" << game_state.game_id << "] " << status_name(game_state.status);
        if (game_state.current_turn)
            std::cout << ", turn: " << *game_state.current_turn
                      << (*game_state.current_turn == my_player_id ? " (you)" : "");
        std::cout << "\n";
        if (game_state.status == GameStatus::Lobby) {
            for (auto &player: game_state.players)
                std::cout << "  " << player.first << ": " << player.second.name.value_or("?")
                          << (player.second.connected ? "" : " (disconnected)") << "\n";
            return;
        }
        for (auto &row: render_board(game_state))
            std::cout << "  " << row << "\n";
        for (auto &player: game_state.players) {
            for (auto &hero: player.second.heroes) {
                std::cout << "  " << hero.id << " " << hero.name << " (" << hero.position.x << ","
                          << hero.position.y << ") hp " << hero.hp.current << "/"
                          << hero.hp.maximum << " mv " << hero.movement.current << " ap "
                          << hero.action_points.current << " mana " << hero.mana.current << "\n";
            }
        }
    }

    void ConsoleSink::on_ability_used(const Hero &caster, const Ability &ability,
                                      const std::string &cue) {
        std::cout << "* " << caster.name << " uses " << ability.name << " [" << cue << "]\n";
    }

    void ConsoleSink::on_hero_died(const Hero &hero, const std::string &cue) {
        std::cout << "* " << hero.name << " of " << hero.owner_id << " died [" << cue << "]\n";
    }

    void ConsoleSink::on_chat_message(const Message::ChatMessage &message) {
        std::cout << "<" << message.channel << "> " << message.sender_name << ": "
                  << message.content << "\n";
    }

    void ConsoleSink::on_error(const std::string &message) {
        std::cerr << "error: " << message << "\n";
    }

    void ConsoleSink::on_game_over(const player_id_t &winner_id, const std::string &winner_name) {
        std::cout << "Game over, " << winner_name
                  << (winner_id == my_player_id ? " (you) won!" : " won.") << "\n";
    }

    void ConsoleSink::on_connection_lost() {
        std::cerr << "error: connection to the server lost\n";
    }
}
