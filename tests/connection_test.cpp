#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <optional>

#include "fake_transport.hpp"

using namespace Fixtures;
using Connection::State;

BOOST_AUTO_TEST_SUITE(connection)

BOOST_AUTO_TEST_CASE(connect_open_and_receive_in_order) {
    FakeTransport transport;
    ManualScheduler timers;
    Connection::ConnectionManager manager(transport, timers.scheduler());
    std::vector<std::string> received;
    manager.set_message_handler([&](const std::string &text) { received.push_back(text); });

    BOOST_TEST((manager.state() == State::Disconnected));
    manager.connect();
    BOOST_TEST((manager.state() == State::Connecting));
    BOOST_TEST(transport.open_calls == 1);
    transport.succeed();
    BOOST_TEST((manager.state() == State::Connected));

    transport.deliver("one");
    transport.deliver("two");
    BOOST_TEST(received.size() == 2u);
    BOOST_TEST(received[0] == "one");
    BOOST_TEST(received[1] == "two");
}

BOOST_AUTO_TEST_CASE(send_is_rejected_unless_connected) {
    FakeTransport transport;
    ManualScheduler timers;
    Connection::ConnectionManager manager(transport, timers.scheduler());

    BOOST_TEST(!manager.send("early"));
    manager.connect();
    BOOST_TEST(!manager.send("connecting"));
    transport.succeed();
    BOOST_TEST(manager.send("ok"));
    BOOST_TEST(transport.sent.size() == 1u);
    BOOST_TEST(transport.sent.front() == "ok");
}

BOOST_AUTO_TEST_CASE(backoff_doubles_and_gives_up) {
    FakeTransport transport;
    ManualScheduler timers;
    Connection::ConnectionManager manager(transport, timers.scheduler());
    bool gave_up = false;
    manager.set_give_up_handler([&]() { gave_up = true; });

    manager.connect();
    transport.fail();
    BOOST_TEST((manager.state() == State::Disconnected));
    for (int attempt = 1; attempt <= 3; ++attempt) {
        BOOST_REQUIRE(timers.callbacks.size() == (size_t) attempt);
        timers.fire_last();
        BOOST_TEST((manager.state() == State::Connecting));
        BOOST_TEST(transport.open_calls == attempt + 1);
        transport.fail();
    }

    BOOST_TEST(timers.delays.size() == 3u);
    BOOST_TEST(timers.delays[0].count() == 2000);
    BOOST_TEST(timers.delays[1].count() == 4000);
    BOOST_TEST(timers.delays[2].count() == 8000);
    BOOST_TEST(gave_up);
    BOOST_TEST((manager.state() == State::Disconnected));
}

BOOST_AUTO_TEST_CASE(successful_open_resets_the_retry_counter) {
    FakeTransport transport;
    ManualScheduler timers;
    Connection::ConnectionManager manager(transport, timers.scheduler());

    manager.connect();
    transport.fail();
    timers.fire_last();
    transport.succeed();
    BOOST_TEST(manager.retry_count() == 0u);

    transport.fail(1011);
    BOOST_TEST(timers.delays.back().count() == 2000);
}

BOOST_AUTO_TEST_CASE(terminal_codes_never_retry) {
    for (uint16_t code: {Connection::NORMAL_CLOSURE, Connection::ROOM_FULL,
                         Connection::GAME_ENDED}) {
        FakeTransport transport;
        ManualScheduler timers;
        Connection::ConnectionManager manager(transport, timers.scheduler());
        std::optional<uint16_t> terminal_code;
        manager.set_terminal_close_handler([&](uint16_t closed) { terminal_code = closed; });

        manager.connect();
        transport.succeed();
        transport.fail(code);
        BOOST_TEST(timers.callbacks.empty());
        BOOST_TEST(terminal_code.value() == code);
        BOOST_TEST((manager.state() == State::Disconnected));
    }
    BOOST_TEST(Connection::is_terminal_close(4001));
    BOOST_TEST(!Connection::is_terminal_close(1006));
}

BOOST_AUTO_TEST_CASE(disconnect_is_intentional_and_final) {
    FakeTransport transport;
    ManualScheduler timers;
    Connection::ConnectionManager manager(transport, timers.scheduler());

    manager.connect();
    transport.succeed();
    manager.disconnect();
    BOOST_TEST((manager.state() == State::Disconnected));
    BOOST_REQUIRE(transport.close_calls.size() == 1u);
    BOOST_TEST(transport.close_calls.front() == Connection::NORMAL_CLOSURE);

    transport.fail(Connection::NORMAL_CLOSURE);
    BOOST_TEST(timers.callbacks.empty());
    BOOST_TEST(!manager.send("late"));
}

BOOST_AUTO_TEST_CASE(stale_retry_is_discarded) {
    FakeTransport transport;
    ManualScheduler timers;
    Connection::ConnectionManager manager(transport, timers.scheduler());

    manager.connect();
    transport.fail();
    BOOST_REQUIRE(timers.callbacks.size() == 1u);
    manager.disconnect();
    timers.fire_last();
    BOOST_TEST(transport.open_calls == 1);

    manager.connect();
    BOOST_TEST(transport.open_calls == 2);
    transport.succeed();
    timers.callbacks.front()();
    BOOST_TEST(transport.open_calls == 2);
    BOOST_TEST((manager.state() == State::Connected));
}

BOOST_AUTO_TEST_CASE(custom_policy) {
    Connection::ReconnectPolicy policy;
    policy.base_delay = std::chrono::milliseconds(100);
    BOOST_TEST(policy.delay_for(1).count() == 200);
    BOOST_TEST(policy.delay_for(4).count() == 1600);
}

BOOST_AUTO_TEST_CASE(delay_saturates_for_large_attempts) {
    Connection::ReconnectPolicy policy;
    BOOST_TEST(policy.delay_for(3).count() == 8000);
    BOOST_TEST(policy.delay_for(6).count() == 60000);
    BOOST_TEST(policy.delay_for(53).count() == 60000);
    BOOST_TEST(policy.delay_for(64).count() == 60000);
    BOOST_TEST(policy.delay_for(UINT32_MAX).count() == 60000);

    policy.base_delay = std::chrono::milliseconds(UINT32_MAX);
    BOOST_TEST(policy.delay_for(10).count() == 60000);
    policy.base_delay = std::chrono::milliseconds(0);
    BOOST_TEST(policy.delay_for(UINT32_MAX).count() == 0);
}

BOOST_AUTO_TEST_SUITE_END()
