#pragma once

#include <optional>
#include <set>
#include <string>

#include "connection.hpp"
#include "game_state.hpp"
#include "message.hpp"
#include "presentation.hpp"

namespace Client {
    struct Selection {
        std::optional<hero_id_t> hero_id;
        std::optional<ability_id_t> ability_id;
        std::optional<hero_id_t> hovered_hero_id;
    };

    // Holds the latest authoritative snapshot and the local player's selection. Snapshots replace
    // the state wholesale; intents are checked against the snapshot and only then sent.
    class GameClient {
    public:
        GameClient(std::string game_id, player_id_t my_player_id,
                   Connection::ConnectionManager &connection,
                   Presentation::PresentationSink &sink)
                : game_id(std::move(game_id)), my_player_id(std::move(my_player_id)),
                  connection(connection), sink(sink) {};

        // Malformed text is logged and dropped.
        void handle_raw_message(const std::string &text);

        void handle_message(const Message::ServerMessage &message);

        void apply_snapshot(const Message::GameStateMessage &message);

        const std::optional<GameState> &state() const {
            return game_state;
        }

        const Selection &selection() const {
            return current_selection;
        }

        const player_id_t &player_id() const {
            return my_player_id;
        }

        bool is_my_turn() const;

        // Only living heroes of the local player can be selected. Changing the hero drops the
        // selected ability.
        bool select_hero(const hero_id_t &hero_id);

        bool select_ability(const ability_id_t &ability_id);

        void hover_hero(const std::optional<hero_id_t> &hero_id);

        void clear_selection();

        std::set<Position> reachable_preview() const;

        std::set<Position> ability_targets_preview() const;

        // Cells the selected ability would hit if aimed at target; empty when it cannot be.
        std::set<Position> area_preview(const Position &target) const;

        bool request_move(const Position &target);

        bool request_ability(const Position &target);

        bool request_ability_on_hero(const hero_id_t &target_hero_id);

        bool request_end_turn();

        bool request_undo();

        bool request_update_name(const std::string &name);

        bool request_start_game();

        bool send_chat(const std::string &content, const std::string &channel);

        std::string my_name;

    private:
        const Hero *selected_hero() const;

        const Ability *selected_ability() const;

        bool reject(const std::string &reason);

        bool send(const std::string &text);

        std::string game_id;
        player_id_t my_player_id;
        Connection::ConnectionManager &connection;
        Presentation::PresentationSink &sink;
        std::optional<GameState> game_state;
        Selection current_selection;
    };
}
