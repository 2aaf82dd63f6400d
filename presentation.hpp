#pragma once

#include <string>
#include <vector>

#include "game_state.hpp"
#include "message.hpp"

namespace Presentation {
    const std::string DEATH_CUE = "death";

    // Sound/animation cue for an ability id.
    std::string ability_cue(const ability_id_t &ability_id);

    // Receives everything the client wants shown or played. Rendering and audio live behind it.
    struct PresentationSink {
        virtual ~PresentationSink() {}

        virtual void on_snapshot(const GameState &game_state) = 0;

        virtual void on_ability_used(const Hero &caster, const Ability &ability,
                                     const std::string &cue) = 0;

        virtual void on_hero_died(const Hero &hero, const std::string &cue) = 0;

        virtual void on_chat_message(const Message::ChatMessage &message) = 0;

        virtual void on_error(const std::string &message) = 0;

        virtual void on_game_over(const player_id_t &winner_id, const std::string &winner_name) = 0;

        virtual void on_connection_lost() = 0;
    };

    // Prints to the terminal.
    struct ConsoleSink : PresentationSink {
        explicit ConsoleSink(player_id_t my_player_id) : my_player_id(my_player_id) {};
        player_id_t my_player_id;

        void on_snapshot(const GameState &game_state) override;

        void on_ability_used(const Hero &caster, const Ability &ability,
                             const std::string &cue) override;

        void on_hero_died(const Hero &hero, const std::string &cue) override;

        void on_chat_message(const Message::ChatMessage &message) override;

        void on_error(const std::string &message) override;

        void on_game_over(const player_id_t &winner_id, const std::string &winner_name) override;

        void on_connection_lost() override;
    };

    std::vector<std::string> render_board(const GameState &game_state);
}
