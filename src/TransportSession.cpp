#include "TransportSession.h"

#include "link_protocol.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <deque>
#include <string>

namespace kairoslink {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using boost::asio::ip::tcp;

// One stream attempt. Handlers hold a shared_ptr to it; once `live` is
// cleared they return without touching the owning session.
struct TransportSession::Conn {
    explicit Conn(asio::io_context& io) : resolver(io), ws(io) {}

    tcp::resolver resolver;
    websocket::stream<beast::tcp_stream> ws;
    beast::flat_buffer buffer;
    std::deque<std::string> outbox;
    PeerAddress peer;
    tcp::resolver::results_type endpoints;
    bool live = true;
    bool upgraded = false;
    bool writing = false;

    void drop() {
        live = false;
        boost::system::error_code ec;
        resolver.cancel();
        beast::get_lowest_layer(ws).socket().close(ec);
    }
};

TransportSession::TransportSession(asio::io_context& io_ctx, const TransportArgs& args)
    : io(io_ctx), A(args) {}

TransportSession::~TransportSession() {
    close();
}

void TransportSession::open(const PeerAddress& peer) {
    close();

    auto c = std::make_shared<Conn>(io);
    c->peer = peer;
    if (c->peer.port == 0) c->peer.port = A.port;
    conn = c;

    log("Connecting to ws://" + c->peer.ip + ":" + std::to_string(c->peer.port) + A.path);

    c->resolver.async_resolve(c->peer.ip, std::to_string(c->peer.port),
        [this, c](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            if (!c->live) return;
            if (ec) { fail(c, "resolve: " + ec.message()); return; }
            c->endpoints = std::move(results);
            on_resolved(c);
        });
}

void TransportSession::on_resolved(const std::shared_ptr<Conn>& c) {
    beast::get_lowest_layer(c->ws).async_connect(c->endpoints,
        [this, c](const boost::system::error_code& ec, const tcp::endpoint&) {
            if (!c->live) return;
            if (ec) { fail(c, "connect: " + ec.message()); return; }
            on_connected(c);
        });
}

void TransportSession::on_connected(const std::shared_ptr<Conn>& c) {
    c->ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    c->ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "kairoslink");
    }));

    std::string host = c->peer.ip + ":" + std::to_string(c->peer.port);
    c->ws.async_handshake(host, A.path,
        [this, c](const boost::system::error_code& ec) {
            if (!c->live) return;
            if (ec) { fail(c, "upgrade: " + ec.message()); return; }
            on_upgraded(c);
        });
}

void TransportSession::on_upgraded(const std::shared_ptr<Conn>& c) {
    c->upgraded = true;

    int64_t now = link_now_ms();
    last_client_id = link_make_client_id(now);
    std::string handshake = link_make_handshake(now, last_client_id);
    log("Sending handshake: " + handshake);
    c->outbox.push_back(std::move(handshake));
    write_next(c);

    read_next(c);
}

void TransportSession::read_next(const std::shared_ptr<Conn>& c) {
    c->ws.async_read(c->buffer,
        [this, c](const boost::system::error_code& ec, size_t) {
            if (!c->live) return;
            if (ec == websocket::error::closed) { fail(c, "stream closed by host"); return; }
            if (ec) { fail(c, "stream error: " + ec.message()); return; }

            LinkFrame f;
            f.binary = c->ws.got_binary();
            std::string payload = beast::buffers_to_string(c->buffer.data());
            c->buffer.consume(c->buffer.size());
            if (f.binary) {
                f.bytes.assign(payload.begin(), payload.end());
            } else {
                f.text = std::move(payload);
            }

            auto cb = on_frame;
            if (cb) cb(f);
            if (c->live) read_next(c);
        });
}

void TransportSession::write_next(const std::shared_ptr<Conn>& c) {
    if (c->writing || c->outbox.empty()) return;
    c->writing = true;
    c->ws.text(true);
    c->ws.async_write(asio::buffer(c->outbox.front()),
        [this, c](const boost::system::error_code& ec, size_t) {
            if (!c->live) return;
            c->writing = false;
            if (ec) { fail(c, "send failed: " + ec.message()); return; }
            c->outbox.pop_front();
            write_next(c);
        });
}

bool TransportSession::send_text(const std::string& text) {
    if (!is_open()) return false;
    conn->outbox.push_back(text);
    write_next(conn);
    return true;
}

void TransportSession::close() {
    if (!conn) return;
    auto c = std::move(conn);
    conn.reset();
    if (!c->live) return;
    c->drop();
    log("Session closed locally");
}

bool TransportSession::is_open() const {
    return conn && conn->live && conn->upgraded;
}

void TransportSession::fail(const std::shared_ptr<Conn>& c, const std::string& reason) {
    if (!c->live) return;
    c->drop();
    if (conn == c) conn.reset();
    log("Session ended: " + reason);
    auto cb = on_closed;
    if (cb) cb(reason);
}

} // namespace kairoslink
