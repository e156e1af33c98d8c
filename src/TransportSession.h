#pragma once

#include "DebugLog.h"
#include "link_config.h"
#include "link_interfaces.h"

#include <boost/asio/io_context.hpp>

#include <memory>
#include <string>

namespace kairoslink {

// WebSocket client to ws://<peer>:<port><path>. Sends the mobile_connect
// handshake as soon as the upgrade completes, then forwards every inbound
// frame. Outbound text frames are queued and written one at a time.
class TransportSession : public ILinkTransport {
public:
    TransportSession(boost::asio::io_context& io, const TransportArgs& args);
    ~TransportSession() override;

    TransportSession(const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;

    void open(const PeerAddress& peer) override;
    bool send_text(const std::string& text) override;
    void close() override;
    bool is_open() const override;

    void set_frame_callback(FrameCallback callback) override { on_frame = std::move(callback); }
    void set_closed_callback(ClosedCallback callback) override { on_closed = std::move(callback); }
    void set_log_sink(LogSink sink) { log_ = std::move(sink); }

    // Client id sent in the last handshake
    const std::string& client_id() const { return last_client_id; }

private:
    struct Conn;

    void on_resolved(const std::shared_ptr<Conn>& c);
    void on_connected(const std::shared_ptr<Conn>& c);
    void on_upgraded(const std::shared_ptr<Conn>& c);
    void read_next(const std::shared_ptr<Conn>& c);
    void write_next(const std::shared_ptr<Conn>& c);
    void fail(const std::shared_ptr<Conn>& c, const std::string& reason);
    void log(const std::string& line) const { log_to(log_, "TransportSession", line); }

private:
    boost::asio::io_context& io;
    TransportArgs A;
    std::shared_ptr<Conn> conn;
    FrameCallback on_frame;
    ClosedCallback on_closed;
    LogSink log_;
    std::string last_client_id;
};

} // namespace kairoslink
