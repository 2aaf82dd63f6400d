#include <boost/test/unit_test.hpp>

#include "fixtures.hpp"
#include "movement.hpp"
#include "turn.hpp"

using namespace Fixtures;

BOOST_AUTO_TEST_SUITE(movement)

BOOST_AUTO_TEST_CASE(reach_is_bounded_by_movement_points) {
    GameState game_state = in_progress_state(10);
    Hero &hero = add_hero(game_state, ALICE, Position(0, 0));
    hero.movement = Gauge(3);

    BOOST_TEST(Movement::can_reach(game_state, hero, Position(2, 1)));
    BOOST_TEST(!Movement::can_reach(game_state, hero, Position(3, 1)));
}

BOOST_AUTO_TEST_CASE(occupied_cell_is_not_reachable) {
    GameState game_state = in_progress_state(10);
    add_hero(game_state, ALICE, Position(0, 0));
    add_hero(game_state, BOB, Position(1, 0));
    Hero &hero = game_state.players.at(ALICE).heroes.front();
    hero.movement = Gauge(1);

    BOOST_TEST(!Movement::can_reach(game_state, hero, Position(1, 0)));
    BOOST_TEST(Movement::can_reach(game_state, hero, Position(0, 1)));
}

BOOST_AUTO_TEST_CASE(reachable_set_excludes_other_heroes_and_includes_free_neighbours) {
    GameState game_state = in_progress_state(10);
    add_hero(game_state, ALICE, Position(4, 4));
    add_hero(game_state, ALICE, Position(5, 4));
    add_hero(game_state, BOB, Position(4, 6));
    const Hero &hero = game_state.players.at(ALICE).heroes.front();

    auto reachable = Movement::compute_reachable_set(game_state, hero);
    BOOST_TEST(!reachable.contains(Position(5, 4)));
    BOOST_TEST(!reachable.contains(Position(4, 6)));
    BOOST_TEST(!reachable.contains(Position(4, 4)));
    BOOST_TEST(reachable.contains(Position(3, 4)));
    BOOST_TEST(reachable.contains(Position(4, 3)));
    BOOST_TEST(reachable.contains(Position(4, 5)));
    for (auto &cell: reachable)
        BOOST_TEST(manhattan_distance(hero.position, cell) <= hero.movement.current);
}

BOOST_AUTO_TEST_CASE(reachable_set_matches_can_reach) {
    GameState game_state = in_progress_state(8);
    game_state.obstacles = {Position(2, 1), Position(2, 2), Position(2, 3)};
    add_hero(game_state, ALICE, Position(1, 2));
    add_hero(game_state, BOB, Position(1, 3));
    const Hero &hero = game_state.players.at(ALICE).heroes.front();

    auto reachable = Movement::compute_reachable_set(game_state, hero);
    for (coordinate_t x = 0; x < 8; ++x) {
        for (coordinate_t y = 0; y < 8; ++y)
            BOOST_TEST(reachable.contains(Position(x, y)) ==
                       Movement::can_reach(game_state, hero, Position(x, y)));
    }
}

BOOST_AUTO_TEST_CASE(only_one_hero_moves_per_turn) {
    GameState game_state = in_progress_state(10);
    add_hero(game_state, ALICE, Position(0, 0));
    add_hero(game_state, ALICE, Position(5, 5));

    Movement::apply_move(game_state, "alice_hero_0", Position(1, 1));
    BOOST_TEST(game_state.moved_hero_id.value() == "alice_hero_0");
    BOOST_TEST((game_state.find_hero("alice_hero_0")->position == Position(1, 1)));

    BOOST_CHECK_THROW(Movement::apply_move(game_state, "alice_hero_1", Position(5, 6)),
                      IllegalIntent);
    BOOST_CHECK_THROW(Movement::apply_move(game_state, "alice_hero_0", Position(1, 2)),
                      IllegalIntent);
}

BOOST_AUTO_TEST_CASE(movement_points_are_not_consumed) {
    GameState game_state = in_progress_state(10);
    add_hero(game_state, ALICE, Position(0, 0));
    Movement::apply_move(game_state, "alice_hero_0", Position(2, 2));
    BOOST_TEST(game_state.find_hero("alice_hero_0")->movement.current == Setup::HERO_MOVEMENT);
}

BOOST_AUTO_TEST_CASE(rejects_out_of_turn_and_out_of_game) {
    GameState game_state = in_progress_state(10);
    add_hero(game_state, BOB, Position(0, 0));
    BOOST_CHECK_THROW(Movement::apply_move(game_state, "bob_hero_0", Position(1, 0)),
                      IllegalIntent);

    game_state.current_turn = BOB;
    game_state.status = GameStatus::GameOver;
    BOOST_CHECK_THROW(Movement::apply_move(game_state, "bob_hero_0", Position(1, 0)),
                      IllegalIntent);
    BOOST_CHECK_THROW(Movement::apply_move(game_state, "nobody", Position(1, 0)), IllegalIntent);
}

BOOST_AUTO_TEST_CASE(moving_onto_itself_is_illegal) {
    GameState game_state = in_progress_state(10);
    Hero &hero = add_hero(game_state, ALICE, Position(3, 3));
    BOOST_TEST(!Movement::can_reach(game_state, hero, Position(3, 3)));
}

BOOST_AUTO_TEST_CASE(undo_restores_position_once) {
    GameState game_state = in_progress_state(10);
    add_hero(game_state, ALICE, Position(2, 2));
    Movement::apply_move(game_state, "alice_hero_0", Position(4, 3));

    Turn::undo_move(game_state, ALICE);
    BOOST_TEST((game_state.find_hero("alice_hero_0")->position == Position(2, 2)));
    BOOST_TEST(!game_state.moved_hero_id.has_value());

    BOOST_CHECK_THROW(Turn::undo_move(game_state, ALICE), IllegalIntent);
    BOOST_TEST(!Movement::undo_move(game_state));
    BOOST_TEST((game_state.find_hero("alice_hero_0")->position == Position(2, 2)));

    Movement::apply_move(game_state, "alice_hero_0", Position(2, 4));
    BOOST_TEST(game_state.moved_hero_id.has_value());
}

BOOST_AUTO_TEST_CASE(undo_after_the_moved_hero_died_only_clears_the_lock) {
    GameState game_state = in_progress_state(10);
    add_hero(game_state, ALICE, Position(2, 2));
    add_hero(game_state, ALICE, Position(6, 6));
    Movement::apply_move(game_state, "alice_hero_0", Position(3, 2));
    game_state.players.at(ALICE).heroes.erase(game_state.players.at(ALICE).heroes.begin());

    BOOST_TEST(Movement::undo_move(game_state));
    BOOST_TEST(!game_state.moved_hero_id.has_value());
    BOOST_TEST((game_state.find_hero("alice_hero_1")->position == Position(6, 6)));
}

BOOST_AUTO_TEST_SUITE_END()
