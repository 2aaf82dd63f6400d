#include "websocket_transport.hpp"

#include <iostream>

using boost::asio::awaitable;
using boost::asio::use_awaitable;
using boost::asio::detached;
using boost::asio::co_spawn;
using batcp = boost::asio::ip::tcp;

namespace beast = boost::beast;
namespace websocket = beast::websocket;

namespace WebSocketTransport {
    void BeastTransport::open() {
        current = std::make_shared<websocket_stream>(io_context);
        co_spawn(io_context, run(current), detached);
    }

    void BeastTransport::send(const std::string &text) {
        if (!current || !current->is_open())
            return;
        beast::error_code error;
        current->text(true);
        current->write(boost::asio::buffer(text), error);
        if (error)
            std::cerr << "error: send failed: " << error.message() << "\n";
    }

    void BeastTransport::close(uint16_t code) {
        if (!current)
            return;
        // Detached streams report nothing more to the events.
        auto stream = current;
        current.reset();
        if (stream->is_open())
            stream->async_close(websocket::close_reason(code), [stream](beast::error_code) {});
        else
            beast::get_lowest_layer(*stream).close();
    }

    awaitable<void> BeastTransport::run(std::shared_ptr<websocket_stream> stream) {
        uint16_t close_code = Connection::ABNORMAL_CLOSURE;
        try {
            batcp::resolver resolver(io_context);
            auto endpoints = co_await resolver.async_resolve(host, port, use_awaitable);
            if (current != stream)
                co_return;
            co_await beast::get_lowest_layer(*stream).async_connect(endpoints, use_awaitable);
            if (current != stream) {
                beast::get_lowest_layer(*stream).close();
                co_return;
            }
            beast::get_lowest_layer(*stream).socket().set_option(batcp::no_delay(true));
            beast::get_lowest_layer(*stream).expires_never();

            stream->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
            co_await stream->async_handshake(host + ":" + port, target, use_awaitable);
            if (current != stream) {
                beast::get_lowest_layer(*stream).close();
                co_return;
            }
            if (events != nullptr)
                events->on_transport_open();

            for (;;) {
                beast::flat_buffer buffer;
                co_await stream->async_read(buffer, use_awaitable);
                if (current == stream && events != nullptr)
                    events->on_transport_message(beast::buffers_to_string(buffer.data()));
            }
        } catch (boost::system::system_error &e) {
            if (e.code() == websocket::error::closed)
                close_code = stream->reason().code;
            else if (current == stream)
                std::cerr << "error: " << e.what() << "\n";
        }
        if (current != stream)
            co_return;
        current.reset();
        if (events != nullptr)
            events->on_transport_closed(close_code);
    }

    Connection::Scheduler make_timer_scheduler(boost::asio::io_context &io_context) {
        return [&io_context](std::chrono::milliseconds delay, std::function<void()> callback) {
            auto timer = std::make_shared<boost::asio::steady_timer>(io_context, delay);
            timer->async_wait([timer, callback](const boost::system::error_code &error) {
                if (!error)
                    callback();
            });
        };
    }
}
