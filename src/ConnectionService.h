#pragma once

#include "DebugLog.h"
#include "FileReceiver.h"
#include "HeartbeatMonitor.h"
#include "LinkStateMachine.h"
#include "MessageRouter.h"
#include "link_config.h"
#include "link_interfaces.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace kairoslink {

struct LinkEvent {
    enum class Kind { StateChanged, Status, Progress, Log };

    Kind kind = Kind::Log;
    ConnectionState state = ConnectionState::Disconnected;
    std::string text;
    double progress = 0.0;
};

// Top-level orchestrator for the link to the companion host.
//
// disconnected/reconnecting -> discovering -> connecting -> connected, with
// every failure routed through the backoff schedule. All work runs on the
// io_context the service was built with; callbacks from collaborators are
// matched against the current cycle so late ones are no-ops.
class ConnectionService {
public:
    using Listener = std::function<void(const LinkEvent&)>;

    ConnectionService(boost::asio::io_context& io, const LinkClientArgs& args,
                      IPeerDiscovery& discovery, IHotspotAssociator& hotspot,
                      ILinkTransport& transport, IHostActions& actions);
    ~ConnectionService();

    ConnectionService(const ConnectionService&) = delete;
    ConnectionService& operator=(const ConnectionService&) = delete;

    void start();
    void force_reconnect();
    void stop();

    // Outbound control messages; only while connected
    bool send_message(const nlohmann::json& payload);
    bool send_notification(const std::string& title, const std::string& content,
                           const std::string& package_name);

    void add_listener(Listener listener);

    // Sink that appends to this service's debug log
    LogSink log_sink();

    ConnectionState state() const { return fsm_.state; }
    bool is_connected() const { return fsm_.state == ConnectionState::Connected; }
    const LinkFsm& fsm() const { return fsm_; }
    const std::string& status_message() const { return status_; }
    const std::optional<PeerAddress>& peer() const { return peer_; }
    double file_receive_progress() const { return files_.progress(); }
    const FileReceiver& file_receiver() const { return files_; }
    const DebugLog& debug_log() const { return debug_; }
    void clear_debug_log() { debug_.clear(); }

    bool reconnect_pending() const { return reconnect_armed_; }
    std::optional<int> last_backoff_s() const { return last_backoff_; }
    bool heartbeat_running() const { return heartbeat_.running(); }
    bool connect_timer_armed() const { return connect_armed_; }

private:
    void start_connection_process();
    void begin_cycle();
    void cleanup_connections();

    void start_broadcast_discovery();
    void on_discovered(uint64_t cycle, const std::string& ip);
    void on_discovery_failed(uint64_t cycle, const std::string& reason);

    void start_hotspot_association();
    void on_association(uint64_t cycle, AssociationResult result,
                        const std::string& ip, const std::string& detail);

    void connect_transport();
    void on_frame(const LinkFrame& frame);
    void on_transport_closed(const std::string& reason);
    void establish_connection();
    void process_message(const ControlMessage& m);

    bool send_raw(const std::string& text);
    void handle_disconnect(const std::string& reason);
    void schedule_reconnect();

    void cancel_connect_timer();
    void cancel_reconnect_timer();
    void arm_clipboard_poll();
    void check_clipboard();

    void set_fsm(const LinkFsm& next);
    void set_state(ConnectionState s);
    void update_status(const std::string& message);
    void log(const std::string& message);
    void notify(const LinkEvent& e);

private:
    boost::asio::io_context& io_;
    LinkClientArgs args_;
    IPeerDiscovery& discovery_;
    IHotspotAssociator& hotspot_;
    ILinkTransport& transport_;
    IHostActions& actions_;

    DebugLog debug_;
    FileReceiver files_;
    MessageRouter router_;
    HeartbeatMonitor heartbeat_;

    boost::asio::steady_timer reconnect_timer_;
    boost::asio::steady_timer connect_timer_;
    boost::asio::steady_timer clipboard_timer_;

    LinkFsm fsm_;
    std::string status_ = "Initializing...";
    std::optional<PeerAddress> peer_;
    std::optional<int> last_backoff_;
    std::string last_clipboard_;
    std::vector<Listener> listeners_;

    uint64_t cycle_ = 0;
    uint64_t reconnect_gen_ = 0;
    uint64_t connect_gen_ = 0;
    uint64_t clipboard_gen_ = 0;
    bool reconnect_armed_ = false;
    bool connect_armed_ = false;
    bool started_ = false;
};

} // namespace kairoslink
