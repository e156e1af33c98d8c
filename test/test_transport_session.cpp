#include "TransportSession.h"
#include "test_util.h"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include <exception>
#include <string>
#include <thread>
#include <vector>

using namespace kairoslink;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using asio::ip::tcp;
using kairoslink_test::run_until;

namespace {

// Accepts one client, reads its handshake, pushes a text and a binary
// frame, reads one client message and closes the stream.
class ScriptedHost {
public:
    ScriptedHost() : acceptor(sio, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {}

    ~ScriptedHost() {
        if (th.joinable()) th.join();
    }

    uint16_t port() const { return acceptor.local_endpoint().port(); }

    void serve() {
        th = std::thread([this] {
            try {
                tcp::socket s(sio);
                acceptor.accept(s);
                websocket::stream<tcp::socket> ws(std::move(s));
                ws.accept();

                beast::flat_buffer b;
                ws.read(b);
                handshake = beast::buffers_to_string(b.data());
                b.consume(b.size());

                ws.text(true);
                ws.write(asio::buffer(std::string(R"({"type":"heartbeat_ack"})")));
                ws.binary(true);
                std::string chunk("\x01\x02\x00\x03", 4);
                ws.write(asio::buffer(chunk));

                ws.read(b);
                from_client = beast::buffers_to_string(b.data());
                b.consume(b.size());

                ws.close(websocket::close_code::normal);
            } catch (const std::exception& e) {
                error = e.what();
            }
        });
    }

    void join() {
        if (th.joinable()) th.join();
    }

    asio::io_context sio;
    tcp::acceptor acceptor;
    std::thread th;
    std::string handshake;
    std::string from_client;
    std::string error;
};

} // namespace

TEST(TransportSession, HandshakeFramesSendAndRemoteClose) {
    ScriptedHost host;
    host.serve();

    asio::io_context io;
    TransportArgs args;
    args.port = host.port();
    TransportSession session(io, args);

    std::vector<LinkFrame> frames;
    std::vector<std::string> closed;
    session.set_frame_callback([&](const LinkFrame& f) { frames.push_back(f); });
    session.set_closed_callback([&](const std::string& r) { closed.push_back(r); });

    EXPECT_FALSE(session.send_text("too early"));
    session.open(PeerAddress{"127.0.0.1", host.port()});

    ASSERT_TRUE(run_until(io, [&] { return frames.size() == 2 || !closed.empty(); }));
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_TRUE(session.is_open());

    EXPECT_FALSE(frames[0].binary);
    EXPECT_EQ(frames[0].text, R"({"type":"heartbeat_ack"})");
    EXPECT_TRUE(frames[1].binary);
    EXPECT_EQ(frames[1].bytes, (std::vector<uint8_t>{1, 2, 0, 3}));

    EXPECT_TRUE(session.send_text(R"({"type":"heartbeat","timestamp":1})"));

    ASSERT_TRUE(run_until(io, [&] { return !closed.empty(); }));
    EXPECT_EQ(closed[0], "stream closed by host");
    EXPECT_FALSE(session.is_open());
    EXPECT_FALSE(session.send_text("after close"));

    host.join();
    EXPECT_TRUE(host.error.empty()) << host.error;

    auto hs = nlohmann::json::parse(host.handshake);
    EXPECT_EQ(hs["type"], "mobile_connect");
    EXPECT_TRUE(hs["timestamp"].is_number_integer());
    EXPECT_EQ(hs["client_id"], session.client_id());
    EXPECT_EQ(session.client_id().rfind("kairos_mobile_", 0), 0u);
    EXPECT_EQ(host.from_client, R"({"type":"heartbeat","timestamp":1})");
}

TEST(TransportSession, RefusedConnectionReportsClosed) {
    uint16_t dead_port = 0;
    {
        asio::io_context tmp;
        tcp::acceptor a(tmp, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        dead_port = a.local_endpoint().port();
    }

    asio::io_context io;
    TransportSession session(io, TransportArgs{});
    std::vector<std::string> closed;
    session.set_closed_callback([&](const std::string& r) { closed.push_back(r); });
    session.open(PeerAddress{"127.0.0.1", dead_port});

    ASSERT_TRUE(run_until(io, [&] { return !closed.empty(); }));
    EXPECT_EQ(closed[0].rfind("connect:", 0), 0u) << closed[0];
    EXPECT_FALSE(session.is_open());
}

TEST(TransportSession, LocalCloseIsSilent) {
    ScriptedHost host;
    asio::io_context io;
    TransportArgs args;
    TransportSession session(io, args);
    std::vector<std::string> closed;
    session.set_closed_callback([&](const std::string& r) { closed.push_back(r); });

    // never accepted: the connect completes into the backlog, the upgrade stalls
    session.open(PeerAddress{"127.0.0.1", host.port()});
    io.poll();
    session.close();
    session.close();

    kairoslink_test::run_for(io, Millis(50));
    EXPECT_TRUE(closed.empty());
    EXPECT_FALSE(session.is_open());
}
