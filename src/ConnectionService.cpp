#include "ConnectionService.h"

#include "link_protocol.h"

#include <exception>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace kairoslink {

namespace asio = boost::asio;

namespace {

std::string resolve_download_dir(const std::string& configured) {
    if (!configured.empty()) return configured;
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return (tmp / "kairoslink").string();
}

const LinkClientArgs& checked(const LinkClientArgs& args) {
    if (args.reconnect.backoff_s.empty()) {
        throw std::invalid_argument("ConnectionService: backoff table is empty");
    }
    if (args.reconnect.max_attempts < 0) {
        throw std::invalid_argument("ConnectionService: max_attempts is negative");
    }
    return args;
}

std::string preview(const std::string& s) {
    constexpr size_t kMax = 50;
    return s.size() > kMax ? s.substr(0, kMax) + "..." : s;
}

} // namespace

ConnectionService::ConnectionService(asio::io_context& io, const LinkClientArgs& args,
                                     IPeerDiscovery& discovery, IHotspotAssociator& hotspot,
                                     ILinkTransport& transport, IHostActions& actions)
    : io_(io),
      args_(checked(args)),
      discovery_(discovery),
      hotspot_(hotspot),
      transport_(transport),
      actions_(actions),
      files_(io, resolve_download_dir(args.download_dir),
             [this](const std::string& path, int page) {
                 try {
                     actions_.open_document(path, page);
                 } catch (const std::exception& e) {
                     log(std::string("Error opening document: ") + e.what());
                 }
             }),
      router_(actions),
      heartbeat_(io, args.heartbeat_period),
      reconnect_timer_(io),
      connect_timer_(io),
      clipboard_timer_(io) {
    files_.set_log_sink(log_sink());
    files_.set_progress_callback([this](double p, const std::string& status) {
        update_status(status);
        LinkEvent e;
        e.kind = LinkEvent::Kind::Progress;
        e.state = fsm_.state;
        e.text = status;
        e.progress = p;
        notify(e);
    });
    router_.set_log_sink(log_sink());

    transport_.set_frame_callback([this](const LinkFrame& f) { on_frame(f); });
    transport_.set_closed_callback([this](const std::string& reason) { on_transport_closed(reason); });
}

ConnectionService::~ConnectionService() {
    ++cycle_;
    cancel_reconnect_timer();
    cancel_connect_timer();
    ++clipboard_gen_;
    clipboard_timer_.cancel();
    heartbeat_.stop();
    discovery_.cancel();
    hotspot_.cancel();
    transport_.set_frame_callback(nullptr);
    transport_.set_closed_callback(nullptr);
    transport_.close();
}

void ConnectionService::start() {
    log("ConnectionService started");
    started_ = true;
    arm_clipboard_poll();
    start_connection_process();
}

void ConnectionService::stop() {
    log("ConnectionService stopping");
    started_ = false;
    ++clipboard_gen_;
    clipboard_timer_.cancel();
    cancel_reconnect_timer();
    cleanup_connections();
    peer_.reset();
    set_state(ConnectionState::Disconnected);
    update_status("Stopped");
}

void ConnectionService::force_reconnect() {
    log("Force reconnect triggered");
    cancel_reconnect_timer();
    cleanup_connections();
    fsm_ = fsm_force_reconnect(fsm_);
    begin_cycle();
}

void ConnectionService::add_listener(Listener listener) {
    listeners_.push_back(std::move(listener));
}

LogSink ConnectionService::log_sink() {
    return [this](const std::string& line) { log(line); };
}

// --- cycle ------------------------------------------------------------------

void ConnectionService::start_connection_process() {
    if (fsm_.state == ConnectionState::Connecting || fsm_.state == ConnectionState::Connected) {
        log("Already connecting/connected, skipping");
        return;
    }
    begin_cycle();
}

void ConnectionService::begin_cycle() {
    cleanup_connections();
    peer_.reset();

    set_fsm(fsm_begin_cycle(fsm_));
    update_status("Searching for KAIROS PC...");
    log("=== Starting Connection Process ===");

    DiscoveryStrategy strategy = fsm_select_strategy(fsm_);
    log(std::string("Discovery strategy: ") + to_string(strategy)
        + " (attempt " + std::to_string(fsm_.attempts) + ")");

    if (strategy == DiscoveryStrategy::FallbackHotspot) {
        start_hotspot_association();
    } else {
        start_broadcast_discovery();
    }
}

void ConnectionService::cleanup_connections() {
    log("Cleaning up connections");
    ++cycle_;
    cancel_connect_timer();
    heartbeat_.stop();
    discovery_.cancel();
    hotspot_.cancel();
    transport_.close();
    files_.abort("link reset");
}

// --- discovery ----------------------------------------------------------------

void ConnectionService::start_broadcast_discovery() {
    if (fsm_.state != ConnectionState::Discovering) return;

    log("=== Starting WiFi Discovery ===");
    update_status("Searching on current WiFi network...");

    uint64_t cycle = cycle_;
    discovery_.start(
        [this, cycle](const std::string& ip) { on_discovered(cycle, ip); },
        [this, cycle](const std::string& reason) { on_discovery_failed(cycle, reason); });
}

void ConnectionService::on_discovered(uint64_t cycle, const std::string& ip) {
    if (cycle != cycle_ || fsm_.state != ConnectionState::Discovering) return;

    peer_ = PeerAddress{ip, args_.transport.port};
    update_status("Found PC at " + ip + ". Connecting...");
    log("PC discovered at " + ip + " - attempting connection");
    connect_transport();
}

void ConnectionService::on_discovery_failed(uint64_t cycle, const std::string& reason) {
    if (cycle != cycle_ || fsm_.state != ConnectionState::Discovering) return;

    log("WiFi discovery failed (" + reason + "), trying hotspot");
    discovery_.cancel();
    start_hotspot_association();
}

void ConnectionService::start_hotspot_association() {
    if (fsm_.state != ConnectionState::Discovering) return;

    if (fsm_should_defer_hotspot(fsm_)) {
        log("Already tried hotspot recently, scheduling reconnect");
        schedule_reconnect();
        return;
    }

    fsm_ = fsm_mark_hotspot_tried(fsm_);
    update_status("Connecting to KAIROS Hotspot...");
    log("=== Attempting Hotspot Connection ===");

    uint64_t cycle = cycle_;
    hotspot_.start([this, cycle](AssociationResult result, const std::string& ip,
                                 const std::string& detail) {
        on_association(cycle, result, ip, detail);
    });
}

void ConnectionService::on_association(uint64_t cycle, AssociationResult result,
                                       const std::string& ip, const std::string& detail) {
    if (cycle != cycle_ || fsm_.state != ConnectionState::Discovering) return;

    switch (result) {
        case AssociationResult::Associated:
            update_status("Connected to Hotspot. Establishing link...");
            peer_ = PeerAddress{ip, args_.transport.port};
            connect_transport();
            break;

        case AssociationResult::NotFound:
            log("KAIROS hotspot not found in scan (" + detail + "). Trying WiFi discovery instead.");
            start_broadcast_discovery();
            break;

        case AssociationResult::Failed:
            log("Hotspot connection error: " + detail);
            update_status("Hotspot connection failed. Retrying discovery...");
            schedule_reconnect();
            break;
    }
}

// --- transport ----------------------------------------------------------------

void ConnectionService::connect_transport() {
    if (!peer_ || peer_->ip.empty()) {
        log("No PC IP available for WebSocket connection");
        schedule_reconnect();
        return;
    }

    log("=== Starting WebSocket Connection to " + peer_->ip + " ===");
    set_state(ConnectionState::Connecting);
    update_status("Establishing secure link...");

    uint64_t gen = ++connect_gen_;
    connect_armed_ = true;
    connect_timer_.expires_after(args_.connect_timeout);
    connect_timer_.async_wait([this, gen](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) return;
        if (gen != connect_gen_) return;
        connect_armed_ = false;
        log("WebSocket connection timeout after "
            + std::to_string(args_.connect_timeout.count()) + " ms");
        if (fsm_.state == ConnectionState::Connecting) handle_disconnect("connection timeout");
    });

    transport_.open(*peer_);
}

void ConnectionService::on_frame(const LinkFrame& frame) {
    if (fsm_.state != ConnectionState::Connecting && fsm_.state != ConnectionState::Connected) {
        log(std::string("Frame ignored in state ") + to_string(fsm_.state));
        return;
    }

    if (frame.binary) {
        log("Received binary data chunk: " + std::to_string(frame.bytes.size()) + " bytes");
    } else {
        log("Received message: " + frame.text);
    }

    if (fsm_.state == ConnectionState::Connecting) {
        log("First message received, establishing connection");
        establish_connection();
    }

    if (frame.binary) {
        files_.on_chunk(frame.bytes);
        return;
    }

    auto m = link_decode_control(frame.text);
    if (!m) {
        log("Error handling JSON message: malformed, dropped");
        return;
    }
    log("Message type: " + (m->type.empty() ? std::string("null") : m->type));
    process_message(*m);
}

void ConnectionService::on_transport_closed(const std::string& reason) {
    if (fsm_.state != ConnectionState::Connecting && fsm_.state != ConnectionState::Connected) {
        log("Transport closed (" + reason + ") while " + to_string(fsm_.state) + ", ignored");
        return;
    }
    log("WebSocket stream ended: " + reason);
    handle_disconnect(reason);
}

void ConnectionService::establish_connection() {
    log("Establishing connection");
    cancel_connect_timer();
    set_fsm(fsm_connected(fsm_));
    last_backoff_.reset();
    update_status("Connected! Ready for symbiotic link.");

    heartbeat_.start(
        [this] { return send_raw(link_make_heartbeat(link_now_ms())); },
        [this] {
            log("Heartbeat failed");
            handle_disconnect("heartbeat send failed");
        });
}

void ConnectionService::process_message(const ControlMessage& m) {
    switch (m.kind) {
        case MessageKind::FileStart:
            log("File transfer start received");
            files_.on_file_start(m.body);
            break;

        case MessageKind::FileEnd:
            log("File transfer end received");
            files_.on_file_end();
            break;

        case MessageKind::ClipboardUpdate: {
            auto content = link_string_field(m.body, "content");
            if (content) last_clipboard_ = *content;
            router_.route(m);
            break;
        }

        default:
            router_.route(m);
            break;
    }
}

// --- outbound -----------------------------------------------------------------

bool ConnectionService::send_message(const nlohmann::json& payload) {
    std::string text;
    try {
        text = payload.dump();
    } catch (const nlohmann::json::exception& e) {
        log(std::string("Error encoding message: ") + e.what());
        return false;
    }
    return send_raw(text);
}

bool ConnectionService::send_notification(const std::string& title, const std::string& content,
                                          const std::string& package_name) {
    log("Sending notification update: " + title);
    std::string text;
    try {
        text = link_make_notification_update(title, content, package_name);
    } catch (const nlohmann::json::exception& e) {
        log(std::string("Error encoding notification: ") + e.what());
        return false;
    }
    return send_raw(text);
}

bool ConnectionService::send_raw(const std::string& text) {
    if (fsm_.state != ConnectionState::Connected) {
        log(std::string("Cannot send message - not connected. State: ") + to_string(fsm_.state));
        return false;
    }

    log("Sending message: " + text);
    bool ok = false;
    try {
        ok = transport_.send_text(text);
    } catch (const std::exception& e) {
        log(std::string("Error sending message: ") + e.what());
        ok = false;
    }

    if (!ok) {
        log("Send failed, dropping link");
        handle_disconnect("send failed");
        return false;
    }
    return true;
}

// --- failure / backoff ----------------------------------------------------------

void ConnectionService::handle_disconnect(const std::string& reason) {
    bool was_connected = fsm_.state == ConnectionState::Connected;
    log("Handling disconnect (" + reason + "). Was connected: "
        + (was_connected ? "true" : "false"));

    if (fsm_.state != ConnectionState::Connecting && fsm_.state != ConnectionState::Connected) {
        log("Not connecting/connected, nothing to tear down");
        return;
    }

    ++cycle_;
    cancel_connect_timer();
    heartbeat_.stop();
    transport_.close();
    files_.abort("connection lost");

    update_status("Connection lost. Reconnecting...");
    schedule_reconnect();
}

void ConnectionService::schedule_reconnect() {
    cancel_reconnect_timer();
    // Leaving discovering: nothing from this pass may fire into the next state
    ++cycle_;
    discovery_.cancel();
    hotspot_.cancel();

    ReconnectDecision d = fsm_schedule_reconnect(fsm_, args_.reconnect);
    if (!d.delay_s) {
        set_fsm(d.next);
        last_backoff_.reset();
        log("Max reconnect attempts reached, giving up until manual retry");
        update_status("Connection failed. Tap refresh to retry.");
        return;
    }

    set_fsm(d.next);
    last_backoff_ = d.delay_s;
    update_status("Reconnecting... (" + std::to_string(fsm_.attempts) + "/"
                  + std::to_string(args_.reconnect.max_attempts) + ")");
    log("Scheduling reconnect in " + std::to_string(*d.delay_s) + "s (attempt "
        + std::to_string(fsm_.attempts) + ")");

    uint64_t gen = reconnect_gen_;
    reconnect_armed_ = true;
    reconnect_timer_.expires_after(args_.backoff_unit * *d.delay_s);
    reconnect_timer_.async_wait([this, gen](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) return;
        if (gen != reconnect_gen_) return;
        reconnect_armed_ = false;
        if (fsm_.state == ConnectionState::Reconnecting) {
            log("Executing scheduled reconnect");
            start_connection_process();
        }
    });
}

void ConnectionService::cancel_connect_timer() {
    ++connect_gen_;
    connect_armed_ = false;
    connect_timer_.cancel();
}

void ConnectionService::cancel_reconnect_timer() {
    ++reconnect_gen_;
    reconnect_armed_ = false;
    reconnect_timer_.cancel();
}

// --- clipboard sync -------------------------------------------------------------

void ConnectionService::arm_clipboard_poll() {
    if (args_.clipboard_poll.count() <= 0) return;

    uint64_t gen = ++clipboard_gen_;
    clipboard_timer_.expires_after(args_.clipboard_poll);
    clipboard_timer_.async_wait([this, gen](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) return;
        if (gen != clipboard_gen_ || !started_) return;
        check_clipboard();
        if (gen == clipboard_gen_ && started_) arm_clipboard_poll();
    });
}

void ConnectionService::check_clipboard() {
    if (fsm_.state != ConnectionState::Connected) return;

    std::optional<std::string> text;
    try {
        text = actions_.read_clipboard();
    } catch (const std::exception& e) {
        log(std::string("Error checking clipboard: ") + e.what());
        return;
    }

    if (!text || text->empty() || *text == last_clipboard_) return;
    last_clipboard_ = *text;
    log("Sending clipboard update: " + preview(*text));
    send_raw(link_make_clipboard_update(*text));
}

// --- observation ----------------------------------------------------------------

void ConnectionService::set_fsm(const LinkFsm& next) {
    ConnectionState prev = fsm_.state;
    fsm_ = next;
    if (prev == next.state) return;

    log(std::string("Connection state changed: ") + to_string(prev) + " -> " + to_string(next.state));
    LinkEvent e;
    e.kind = LinkEvent::Kind::StateChanged;
    e.state = next.state;
    e.text = to_string(next.state);
    notify(e);
}

void ConnectionService::set_state(ConnectionState s) {
    set_fsm(fsm_with_state(fsm_, s));
}

void ConnectionService::update_status(const std::string& message) {
    log("Status update: " + message);
    status_ = message;
    LinkEvent e;
    e.kind = LinkEvent::Kind::Status;
    e.state = fsm_.state;
    e.text = message;
    notify(e);
}

void ConnectionService::log(const std::string& message) {
    std::string line = debug_.append(message);
    LinkEvent e;
    e.kind = LinkEvent::Kind::Log;
    e.state = fsm_.state;
    e.text = std::move(line);
    notify(e);
}

void ConnectionService::notify(const LinkEvent& e) {
    for (const auto& l : listeners_) {
        if (l) l(e);
    }
}

} // namespace kairoslink
