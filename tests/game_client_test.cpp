#include <boost/test/unit_test.hpp>

#include <nlohmann/json.hpp>

#include "fake_transport.hpp"
#include "fixtures.hpp"
#include "game_client.hpp"
#include "serialization.hpp"

using namespace Fixtures;

namespace {
    struct RecordingSink : Presentation::PresentationSink {
        int snapshots = 0;
        std::vector<std::string> deaths;
        std::vector<std::string> cues;
        std::vector<std::string> errors;
        std::vector<std::string> chat;
        std::optional<std::string> winner;
        bool connection_lost = false;

        void on_snapshot(const GameState &) override {
            snapshots++;
        }

        void on_ability_used(const Hero &, const Ability &, const std::string &cue) override {
            cues.push_back(cue);
        }

        void on_hero_died(const Hero &hero, const std::string &cue) override {
            deaths.push_back(hero.id);
            cues.push_back(cue);
        }

        void on_chat_message(const Message::ChatMessage &message) override {
            chat.push_back(message.content);
        }

        void on_error(const std::string &message) override {
            errors.push_back(message);
        }

        void on_game_over(const player_id_t &, const std::string &winner_name) override {
            winner = winner_name;
        }

        void on_connection_lost() override {
            connection_lost = true;
        }
    };

    struct ClientFixture {
        FakeTransport transport;
        ManualScheduler timers;
        Connection::ConnectionManager connection{transport, timers.scheduler()};
        RecordingSink sink;
        Client::GameClient client{"test_game", ALICE, connection, sink};

        ClientFixture() {
            connection.set_message_handler([this](const std::string &text) {
                client.handle_raw_message(text);
            });
            connection.connect();
            transport.succeed();
        }

        void push(const GameState &game_state) {
            Message::GameStateMessage message;
            message.game_state = game_state;
            transport.deliver(Serialization::serialize(message));
        }

        std::string last_sent_type() {
            return nlohmann::json::parse(transport.sent.back())["type"].get<std::string>();
        }
    };

    GameState two_hero_state() {
        GameState game_state = in_progress_state(10);
        add_hero(game_state, ALICE, Position(0, 0));
        add_hero(game_state, BOB, Position(1, 0));
        return game_state;
    }
}

BOOST_FIXTURE_TEST_SUITE(game_client, ClientFixture)

BOOST_AUTO_TEST_CASE(snapshot_replaces_state) {
    push(two_hero_state());
    BOOST_REQUIRE(client.state().has_value());
    BOOST_TEST(client.state()->players.size() == 2u);
    BOOST_TEST(client.is_my_turn());

    GameState next = two_hero_state();
    next.players.at(BOB).heroes.clear();
    push(next);
    BOOST_TEST((client.state()->find_hero("bob_hero_0") == nullptr));
    BOOST_TEST(sink.snapshots == 2);
}

BOOST_AUTO_TEST_CASE(malformed_message_is_dropped) {
    push(two_hero_state());
    transport.deliver("{broken");
    transport.deliver(R"({"type":"game_state","payload":{}})");
    BOOST_TEST((client.state()->find_hero("alice_hero_0") != nullptr));
    BOOST_TEST(sink.snapshots == 1);
}

BOOST_AUTO_TEST_CASE(only_own_living_heroes_are_selectable) {
    push(two_hero_state());
    BOOST_TEST(!client.select_hero("bob_hero_0"));
    BOOST_TEST(client.select_hero("alice_hero_0"));
    BOOST_TEST(client.select_ability("damage_1"));
    BOOST_TEST(!client.select_ability("unknown"));
}

BOOST_AUTO_TEST_CASE(selection_of_a_removed_hero_is_cleared) {
    push(two_hero_state());
    client.select_hero("alice_hero_0");
    client.hover_hero(std::string("bob_hero_0"));

    GameState next = two_hero_state();
    next.players.at(ALICE).heroes.clear();
    next.players.at(BOB).heroes.clear();
    push(next);
    BOOST_TEST(!client.selection().hero_id.has_value());
    BOOST_TEST(!client.selection().hovered_hero_id.has_value());
}

BOOST_AUTO_TEST_CASE(turn_change_clears_selection) {
    push(two_hero_state());
    client.select_hero("alice_hero_0");
    GameState next = two_hero_state();
    next.current_turn = BOB;
    push(next);
    BOOST_TEST(!client.selection().hero_id.has_value());
}

BOOST_AUTO_TEST_CASE(legal_move_is_sent_illegal_is_not) {
    push(two_hero_state());
    client.select_hero("alice_hero_0");

    BOOST_TEST(!client.request_move(Position(1, 0)));
    BOOST_TEST(transport.sent.empty());
    BOOST_TEST(sink.errors.size() == 1u);

    BOOST_TEST(client.request_move(Position(0, 2)));
    BOOST_REQUIRE(transport.sent.size() == 1u);
    BOOST_TEST(last_sent_type() == "move_hero");
    BOOST_TEST((client.state()->find_hero("alice_hero_0")->position == Position(0, 0)));
}

BOOST_AUTO_TEST_CASE(previews_follow_the_snapshot) {
    push(two_hero_state());
    client.select_hero("alice_hero_0");
    auto reachable = client.reachable_preview();
    BOOST_TEST(reachable.contains(Position(0, 1)));
    BOOST_TEST(!reachable.contains(Position(1, 0)));

    client.select_ability("explosion_1");
    BOOST_TEST(client.ability_targets_preview().contains(Position(1, 0)));
    BOOST_TEST(client.area_preview(Position(1, 1)).size() == 5u);
    BOOST_TEST(client.area_preview(Position(9, 9)).empty());
}

BOOST_AUTO_TEST_CASE(ability_intent_plays_its_cue) {
    push(two_hero_state());
    client.select_hero("alice_hero_0");
    client.select_ability("ranged_1");
    BOOST_TEST(client.request_ability_on_hero("bob_hero_0"));
    BOOST_TEST(last_sent_type() == "use_ability");
    BOOST_REQUIRE(sink.cues.size() == 1u);
    BOOST_TEST(sink.cues.front() == "bow");
}

BOOST_AUTO_TEST_CASE(deaths_and_game_over_reach_the_sink) {
    push(two_hero_state());
    client.select_hero("alice_hero_0");

    GameState next = two_hero_state();
    Hero dead = next.players.at(BOB).heroes.front();
    dead.hp.current = 0;
    next.players.at(BOB).heroes.clear();
    next.status = GameStatus::GameOver;
    next.winner_id = ALICE;
    Message::GameStateMessage message;
    message.game_state = next;
    message.dead_heroes.push_back(dead);
    message.winner_id = ALICE;
    message.winner_name = "Alice";
    transport.deliver(Serialization::serialize(message));

    BOOST_REQUIRE(sink.deaths.size() == 1u);
    BOOST_TEST(sink.deaths.front() == "bob_hero_0");
    BOOST_TEST(sink.cues.back() == "death");
    BOOST_TEST(sink.winner.value() == "Alice");
    BOOST_TEST(!client.selection().hero_id.has_value());
    BOOST_TEST(!client.request_end_turn());
}

BOOST_AUTO_TEST_CASE(turn_intents_need_the_turn) {
    GameState game_state = two_hero_state();
    game_state.current_turn = BOB;
    push(game_state);
    BOOST_TEST(!client.request_end_turn());
    BOOST_TEST(!client.request_undo());
    BOOST_TEST(transport.sent.empty());

    game_state.current_turn = ALICE;
    game_state.moved_hero_id = "alice_hero_0";
    push(game_state);
    BOOST_TEST(client.request_undo());
    BOOST_TEST(last_sent_type() == "undo_move");
    BOOST_TEST(client.request_end_turn());
    BOOST_TEST(last_sent_type() == "end_turn");
}

BOOST_AUTO_TEST_CASE(nothing_is_sent_while_disconnected) {
    push(two_hero_state());
    transport.fail();
    BOOST_TEST(!client.request_end_turn());
    BOOST_TEST(transport.sent.empty());
}

BOOST_AUTO_TEST_CASE(chat_and_errors_reach_the_sink) {
    transport.deliver(Serialization::serialize(
            Message::ChatMessage{"bob", "Bob", "hello", "2024-01-01T00:00:00Z", "global"}));
    transport.deliver(Serialization::serialize(Message::ErrorMessage{"Not your turn"}));
    BOOST_TEST(sink.chat.front() == "hello");
    BOOST_TEST(sink.errors.front() == "Not your turn");
}

BOOST_AUTO_TEST_CASE(only_the_creator_starts_a_full_lobby) {
    GameState lobby = in_progress_state(10);
    lobby.status = GameStatus::Lobby;
    lobby.current_turn.reset();
    lobby.creator_id = BOB;
    push(lobby);
    BOOST_TEST(!client.request_start_game());

    lobby.creator_id = ALICE;
    push(lobby);
    BOOST_TEST(client.request_start_game());
    BOOST_TEST(last_sent_type() == "start_game");
}

BOOST_AUTO_TEST_CASE(ability_cues) {
    BOOST_TEST(Presentation::ability_cue("heal_1") == "heal");
    BOOST_TEST(Presentation::ability_cue("damage_1") == "punch");
    BOOST_TEST(Presentation::ability_cue("explosion_1") == "explosion");
    BOOST_TEST(Presentation::ability_cue("something_else") == "damage");
}

BOOST_AUTO_TEST_SUITE_END()
