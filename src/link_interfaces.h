#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace kairoslink {

// PeerAddress - resolved host address plus the fixed link port
struct PeerAddress {
    std::string ip;
    uint16_t port = 0;
};

// LinkFrame - one inbound message-stream frame
//
// Text frames carry JSON control messages, binary frames carry file chunks.
struct LinkFrame {
    bool binary = false;
    std::string text;
    std::vector<uint8_t> bytes;
};

// IPeerDiscovery - locate a host by listening for its advertisement
class IPeerDiscovery {
public:
    using FoundCallback = std::function<void(const std::string& ip)>;
    using FailedCallback = std::function<void(const std::string& reason)>;

    virtual ~IPeerDiscovery() = default;

    // Begin listening. Exactly one of the callbacks fires per start(),
    // unless cancel() is called first.
    virtual void start(FoundCallback on_found, FailedCallback on_failed) = 0;

    // Stop listening. Safe to call at any time, any number of times.
    virtual void cancel() = 0;
};

enum class AssociationResult {
    Associated,   // on the fallback network, host reachable at its static address
    NotFound,     // fallback network not visible in a scan
    Failed,       // association or verification failed
};

// IHotspotAssociator - join the host's fallback access point
class IHotspotAssociator {
public:
    using DoneCallback = std::function<void(AssociationResult result,
                                            const std::string& ip,
                                            const std::string& detail)>;

    virtual ~IHotspotAssociator() = default;

    virtual void start(DoneCallback on_done) = 0;
    virtual void cancel() = 0;
};

// IWifiControl - device Wi-Fi association primitives (OS specific)
//
// Implementations may block; they may also throw, callers convert that
// into an association failure.
class IWifiControl {
public:
    virtual ~IWifiControl() = default;

    virtual std::optional<std::string> current_ssid() = 0;
    virtual std::vector<std::string> scan() = 0;
    virtual bool disconnect() = 0;
    virtual bool connect(const std::string& ssid, const std::string& password) = 0;
};

// ILinkTransport - single bidirectional message stream to the host
class ILinkTransport {
public:
    using FrameCallback = std::function<void(const LinkFrame& frame)>;
    using ClosedCallback = std::function<void(const std::string& reason)>;

    virtual ~ILinkTransport() = default;

    // Open the stream and send the opening handshake. Failure to open is
    // reported through the closed callback.
    virtual void open(const PeerAddress& peer) = 0;

    // Queue a text frame; false if the stream is not open
    virtual bool send_text(const std::string& text) = 0;

    // Drop the stream without reporting it through the closed callback
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    virtual void set_frame_callback(FrameCallback callback) = 0;
    virtual void set_closed_callback(ClosedCallback callback) = 0;
};

// IHostActions - local side effects requested by the host
class IHostActions {
public:
    virtual ~IHostActions() = default;

    virtual void write_clipboard(const std::string& text) = 0;
    virtual std::optional<std::string> read_clipboard() = 0;
    virtual void open_url(const std::string& url) = 0;
    virtual void connect_headset(const std::string& name) = 0;
    virtual void ensure_hotspot_on() = 0;
    virtual void open_document(const std::string& path, int page) = 0;
};

} // namespace kairoslink
