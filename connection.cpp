#include "connection.hpp"

#include <iostream>

namespace Connection {
    ConnectionManager::ConnectionManager(Transport &transport, Scheduler scheduler,
                                         ReconnectPolicy policy)
            : transport(transport), scheduler(std::move(scheduler)), policy(policy) {
        transport.attach(this);
    }

    void ConnectionManager::connect() {
        if (current_state != State::Disconnected)
            return;
        ++generation;
        stopped = false;
        retries = 0;
        open_transport();
    }

    void ConnectionManager::disconnect() {
        ++generation;
        stopped = true;
        if (current_state == State::Disconnected)
            return;
        current_state = State::Disconnected;
        transport.close(NORMAL_CLOSURE);
    }

    bool ConnectionManager::send(const std::string &text) {
        if (current_state != State::Connected)
            return false;
        transport.send(text);
        return true;
    }

    void ConnectionManager::open_transport() {
        current_state = State::Connecting;
        transport.open();
    }

    void ConnectionManager::on_transport_open() {
        if (current_state != State::Connecting)
            return;
        current_state = State::Connected;
        retries = 0;
        if (open_handler)
            open_handler();
    }

    void ConnectionManager::on_transport_message(const std::string &text) {
        if (current_state != State::Connected)
            return;
        if (message_handler)
            message_handler(text);
    }

    void ConnectionManager::on_transport_closed(uint16_t code) {
        if (current_state == State::Disconnected)
            return;
        current_state = State::Disconnected;

        if (stopped || is_terminal_close(code)) {
            stopped = true;
            if (terminal_close_handler)
                terminal_close_handler(code);
            return;
        }
        if (retries >= policy.max_retries) {
            stopped = true;
            std::cerr << "error: giving up after " << retries << " reconnect attempts\n";
            if (give_up_handler)
                give_up_handler();
            return;
        }
        schedule_retry();
    }

    void ConnectionManager::schedule_retry() {
        ++retries;
        auto delay = policy.delay_for(retries);
        std::cout << "Connection lost, retrying in " << delay.count() << " ms (attempt "
                  << retries << " of " << policy.max_retries << ")\n";
        uint64_t scheduled_generation = generation;
        scheduler(delay, [this, scheduled_generation]() {
            if (scheduled_generation != generation || stopped ||
                current_state != State::Disconnected)
                return;
            open_transport();
        });
    }
}
