#include "umelink/net/connection/websocket_session.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace umelink;
using namespace std::chrono_literals;

namespace beast     = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp           = boost::asio::ip::tcp;

namespace
{

// Recorded session events; handlers run on the io thread while the session holds its lock.
struct SessionEvents
{
    SessionHandlers handlers()
    {
        SessionHandlers result;
        result.on_opened = [this](SessionId) { std::lock_guard<std::mutex> lock(mutex); ++opened; };
        result.on_message = [this](SessionId, const std::string& text)
        {
            std::lock_guard<std::mutex> lock(mutex);
            messages.push_back(text);
        };
        result.on_closed = [this](SessionId, std::uint16_t code, const std::string& reason)
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++closed;
            close_code  = code;
            close_reason = reason;
        };
        result.on_failed = [this](SessionId, const std::string& reason)
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++failed;
            failure = reason;
        };
        return result;
    }

    int terminal_events()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return closed + failed;
    }

    std::mutex mutex;
    int opened = 0;
    int closed = 0;
    int failed = 0;
    std::uint16_t close_code = 0;
    std::string close_reason;
    std::string failure;
    std::vector<std::string> messages;
};

// One-connection backend: greets, echoes one message, then closes normally.
// With binary_greeting a binary frame goes out ahead of the text greeting.
class EchoBackend
{
public:
    explicit EchoBackend(bool binary_greeting = false)
        : _binary_greeting(binary_greeting), _acceptor(_io_context, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0))
    {
        _thread = std::thread([this]() { serve(); });
    }

    ~EchoBackend()
    {
        if (_thread.joinable())
        {
            _thread.join();
        }
    }

    std::uint16_t port() const { return _acceptor.local_endpoint().port(); }

    std::string target()
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _target;
    }

    std::string received()
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _received;
    }

private:
    void serve()
    {
        boost::system::error_code error_code;
        tcp::socket socket(_io_context);
        _acceptor.accept(socket, error_code);
        if (error_code)
        {
            return;
        }

        beast::flat_buffer buffer;
        beast::http::request<beast::http::string_body> request;
        beast::http::read(socket, buffer, request, error_code);
        if (error_code)
        {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _target = std::string(request.target());
        }

        websocket::stream<tcp::socket> ws(std::move(socket));
        ws.accept(request, error_code);
        if (error_code)
        {
            return;
        }

        if (_binary_greeting)
        {
            const std::string blob("\x01\x02\x03", 3);
            ws.binary(true);
            ws.write(boost::asio::buffer(blob), error_code);
        }
        ws.text(true);
        ws.write(boost::asio::buffer(std::string("hello")), error_code);

        beast::flat_buffer message;
        ws.read(message, error_code);
        if (error_code)
        {
            return;
        }
        const std::string text = beast::buffers_to_string(message.data());
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _received = text;
        }
        ws.write(boost::asio::buffer("echo:" + text), error_code);

        ws.close(websocket::close_reason(websocket::close_code::normal, "done"), error_code);
        // Drain until the peer's close frame arrives
        beast::flat_buffer drain;
        while (!error_code)
        {
            ws.read(drain, error_code);
        }
    }

    bool _binary_greeting;
    boost::asio::io_context _io_context;
    tcp::acceptor _acceptor;
    std::thread _thread;
    std::mutex _mutex;
    std::string _target;
    std::string _received;
};

} // namespace

class WebSocketSessionTest : public ::testing::Test
{
protected:
    bool run_until(const std::function<bool()>& predicate)
    {
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (!predicate())
        {
            if (std::chrono::steady_clock::now() > deadline)
            {
                return false;
            }
            io_context.restart();
            io_context.run_for(5ms);
        }
        return true;
    }

    std::shared_ptr<WebSocketSession> make_session(SessionId id, std::size_t max_queued_bytes = WebSocketOptions::default_max_queued_bytes)
    {
        WebSocketOptions options;
        options.path             = "/ws_bidirectional";
        options.open_timeout     = 2s;
        options.max_queued_bytes = max_queued_bytes;
        return std::make_shared<WebSocketSession>(io_context, id, events.handlers(), options);
    }

    boost::asio::io_context io_context;
    SessionEvents events;
};

TEST_F(WebSocketSessionTest, ExchangesTextAndReportsPeerClose)
{
    EchoBackend backend;
    auto session = make_session(1);
    EXPECT_FALSE(session->send("too early"));

    session->async_open("127.0.0.1", backend.port());
    ASSERT_TRUE(run_until(
        [this]()
        {
            std::lock_guard<std::mutex> lock(events.mutex);
            return events.opened == 1 && !events.messages.empty();
        }));
    EXPECT_EQ(backend.target(), "/ws_bidirectional");

    EXPECT_TRUE(session->send("ping"));
    ASSERT_TRUE(run_until([this]() { return events.terminal_events() == 1; }));

    std::lock_guard<std::mutex> lock(events.mutex);
    EXPECT_EQ(events.messages, (std::vector<std::string> {"hello", "echo:ping"}));
    EXPECT_EQ(events.closed, 1);
    EXPECT_EQ(events.failed, 0);
    EXPECT_EQ(events.close_code, close_code::normal);
    EXPECT_EQ(events.close_reason, "done");
    EXPECT_EQ(backend.received(), "ping");
    EXPECT_FALSE(session->send("after close"));
}

TEST_F(WebSocketSessionTest, BinaryFramesAreNotDelivered)
{
    EchoBackend backend(true);
    auto session = make_session(4);

    session->async_open("127.0.0.1", backend.port());
    ASSERT_TRUE(run_until(
        [this]()
        {
            std::lock_guard<std::mutex> lock(events.mutex);
            return !events.messages.empty();
        }));
    EXPECT_NE(session->to_string().find("open"), std::string::npos);

    EXPECT_TRUE(session->send("ping"));
    ASSERT_TRUE(run_until([this]() { return events.terminal_events() == 1; }));

    std::lock_guard<std::mutex> lock(events.mutex);
    EXPECT_EQ(events.messages, (std::vector<std::string> {"hello", "echo:ping"}));
    EXPECT_EQ(events.closed, 1);
    EXPECT_EQ(events.failed, 0);
}

TEST_F(WebSocketSessionTest, SendBeyondQueueLimitIsRejected)
{
    EchoBackend backend;
    auto session = make_session(5, 8);

    session->async_open("127.0.0.1", backend.port());
    ASSERT_TRUE(run_until(
        [this]()
        {
            std::lock_guard<std::mutex> lock(events.mutex);
            return events.opened == 1;
        }));

    // Nothing is written while the io_context isn't running, so queued bytes add up
    EXPECT_FALSE(session->send("0123456789"));
    EXPECT_EQ(session->queued_bytes(), 0U);
    EXPECT_TRUE(session->send("ping"));
    EXPECT_EQ(session->queued_bytes(), 4U);
    EXPECT_FALSE(session->send("12345"));
    EXPECT_TRUE(session->send("pong"));
    EXPECT_EQ(session->queued_bytes(), 8U);

    ASSERT_TRUE(run_until([this]() { return events.terminal_events() == 1; }));
    EXPECT_EQ(backend.received(), "ping");
    EXPECT_EQ(session->queued_bytes(), 0U);
    EXPECT_NE(session->to_string().find("terminated"), std::string::npos);
}

TEST_F(WebSocketSessionTest, UnreachableEndpointFails)
{
    std::uint16_t port = 0;
    {
        // Grab a free port, then release it so nothing listens there
        tcp::acceptor acceptor(io_context, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }

    auto session = make_session(2);
    session->async_open("127.0.0.1", port);
    ASSERT_TRUE(run_until([this]() { return events.terminal_events() == 1; }));

    std::lock_guard<std::mutex> lock(events.mutex);
    EXPECT_EQ(events.opened, 0);
    EXPECT_EQ(events.failed, 1);
    EXPECT_FALSE(events.failure.empty());
}

TEST_F(WebSocketSessionTest, CloseSuppressesLaterEvents)
{
    std::uint16_t port = 0;
    {
        tcp::acceptor acceptor(io_context, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }

    auto session = make_session(3);
    session->async_open("127.0.0.1", port);
    session->close(close_code::going_away, "superseded");

    io_context.restart();
    io_context.run_for(100ms);

    std::lock_guard<std::mutex> lock(events.mutex);
    EXPECT_EQ(events.opened, 0);
    EXPECT_EQ(events.closed + events.failed, 0);
}

TEST(WebSocketSessionFactoryTest, CreatesSessionsWithGivenId)
{
    boost::asio::io_context io_context;
    WebSocketSessionFactory factory(io_context, WebSocketOptions {});

    auto session = factory.create(42, SessionHandlers {});
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->id(), 42U);
}
