#include <boost/test/unit_test.hpp>

#include "fixtures.hpp"
#include "movement.hpp"
#include "turn.hpp"

using namespace Fixtures;

namespace {
    GameState lobby_state() {
        GameState game_state("lobby_game");
        Player alice(ALICE);
        alice.name = "Alice";
        alice.connected = true;
        game_state.players[ALICE] = alice;
        game_state.creator_id = ALICE;
        return game_state;
    }

    void add_bob(GameState &game_state, bool named = true) {
        Player bob(BOB);
        if (named)
            bob.name = "Bob";
        bob.connected = true;
        game_state.players[BOB] = bob;
    }
}

BOOST_AUTO_TEST_SUITE(turn)

BOOST_AUTO_TEST_CASE(end_turn_clears_lock_refills_and_flips) {
    GameState game_state = in_progress_state(10);
    add_hero(game_state, ALICE, Position(0, 0));
    add_hero(game_state, BOB, Position(9, 9));
    Movement::apply_move(game_state, "alice_hero_0", Position(1, 1));
    game_state.find_hero("alice_hero_0")->action_points.current = 0;
    game_state.find_hero("bob_hero_0")->movement.current = 2;

    Turn::end_turn(game_state, ALICE);

    BOOST_TEST(game_state.current_turn.value() == BOB);
    BOOST_TEST(!game_state.moved_hero_id.has_value());
    for (auto hero: game_state.all_heroes()) {
        BOOST_TEST(hero->movement.current == hero->movement.maximum);
        BOOST_TEST(hero->action_points.current == hero->action_points.maximum);
        BOOST_TEST((hero->start_position == hero->position));
    }
}

BOOST_AUTO_TEST_CASE(mana_is_a_per_game_budget) {
    GameState game_state = in_progress_state(10);
    add_hero(game_state, ALICE, Position(0, 0));
    game_state.find_hero("alice_hero_0")->mana.current = 3;

    Turn::end_turn(game_state, ALICE);
    Turn::end_turn(game_state, BOB);

    BOOST_TEST(game_state.find_hero("alice_hero_0")->mana.current == 3);
}

BOOST_AUTO_TEST_CASE(returning_player_gets_the_turn_only_when_it_is_orphaned) {
    GameState game_state = in_progress_state(10);
    add_hero(game_state, BOB, Position(9, 9));
    game_state.find_hero("bob_hero_0")->action_points.current = 0;
    game_state.players.at(BOB).connected = false;
    Turn::player_disconnected(game_state, ALICE);
    BOOST_TEST(game_state.current_turn.value() == ALICE);

    Turn::player_reconnected(game_state, BOB);
    BOOST_TEST(game_state.current_turn.value() == BOB);
    BOOST_TEST(game_state.find_hero("bob_hero_0")->action_points.current ==
               game_state.find_hero("bob_hero_0")->action_points.maximum);

    Turn::player_reconnected(game_state, ALICE);
    BOOST_TEST(game_state.current_turn.value() == BOB);
}

BOOST_AUTO_TEST_CASE(end_turn_rejected_for_the_waiting_player) {
    GameState game_state = in_progress_state(10);
    BOOST_CHECK_THROW(Turn::end_turn(game_state, BOB), IllegalIntent);
    game_state.status = GameStatus::GameOver;
    BOOST_CHECK_THROW(Turn::end_turn(game_state, ALICE), IllegalIntent);
}

BOOST_AUTO_TEST_CASE(turn_stays_when_the_opponent_is_away) {
    GameState game_state = in_progress_state(10);
    game_state.players.at(BOB).connected = false;
    Turn::end_turn(game_state, ALICE);
    BOOST_TEST(game_state.current_turn.value() == ALICE);
}

BOOST_AUTO_TEST_CASE(disconnect_of_the_active_player_passes_the_turn) {
    GameState game_state = in_progress_state(10);
    Turn::player_disconnected(game_state, ALICE);
    BOOST_TEST(!game_state.players.at(ALICE).connected);
    BOOST_TEST(game_state.current_turn.value() == BOB);

    Turn::player_disconnected(game_state, BOB);
    BOOST_TEST(game_state.current_turn.value() == BOB);
}

BOOST_AUTO_TEST_CASE(start_game_builds_the_board) {
    GameState game_state = lobby_state();
    add_bob(game_state);
    Setup::RandomNumberGenerator random_number_generator(42);

    Turn::start_game(game_state, ALICE, random_number_generator, Setup::BoardSettings());

    BOOST_TEST((game_state.status == GameStatus::InProgress));
    BOOST_TEST(game_state.current_turn.value() == ALICE);
    BOOST_TEST(game_state.players.at(ALICE).heroes.size() == 4u);
    BOOST_TEST(game_state.players.at(BOB).heroes.size() == 4u);
    std::set<Position> occupied;
    for (auto hero: game_state.all_heroes()) {
        BOOST_TEST(!game_state.obstacles.contains(hero->position));
        BOOST_TEST(occupied.insert(hero->position).second);
    }
}

BOOST_AUTO_TEST_CASE(start_game_preconditions) {
    Setup::RandomNumberGenerator random_number_generator(7);
    Setup::BoardSettings settings;

    GameState alone = lobby_state();
    BOOST_CHECK_THROW(Turn::start_game(alone, ALICE, random_number_generator, settings),
                      IllegalIntent);

    GameState unnamed = lobby_state();
    add_bob(unnamed, false);
    BOOST_CHECK_THROW(Turn::start_game(unnamed, ALICE, random_number_generator, settings),
                      IllegalIntent);

    GameState ready = lobby_state();
    add_bob(ready);
    BOOST_CHECK_THROW(Turn::start_game(ready, BOB, random_number_generator, settings),
                      IllegalIntent);
    BOOST_TEST((ready.status == GameStatus::Lobby));

    Turn::start_game(ready, ALICE, random_number_generator, settings);
    BOOST_CHECK_THROW(Turn::start_game(ready, ALICE, random_number_generator, settings),
                      IllegalIntent);
}

BOOST_AUTO_TEST_CASE(no_winner_while_both_sides_stand) {
    GameState game_state = in_progress_state(10);
    add_hero(game_state, ALICE, Position(0, 0));
    add_hero(game_state, BOB, Position(9, 9));
    BOOST_TEST(!Turn::check_win_condition(game_state, ALICE).has_value());
    BOOST_TEST((game_state.status == GameStatus::InProgress));
}

BOOST_AUTO_TEST_SUITE_END()
