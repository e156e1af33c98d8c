#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace kairoslink {

// Wire constants shared with the host
constexpr uint16_t kDiscoveryPort = 8888;
constexpr uint16_t kLinkPort = 8000;
constexpr const char* kLinkPath = "/ws";

constexpr const char* kHotspotSsid = "KAIROS_LINK";
constexpr const char* kHotspotPassword = "kairos1234";
constexpr const char* kHotspotIp = "192.168.137.1";

constexpr const char* kClientIdPrefix = "kairos_mobile_";

// Control message type tags
namespace msg {
constexpr const char* kMobileConnect = "mobile_connect";
constexpr const char* kHeartbeat = "heartbeat";
constexpr const char* kHeartbeatAck = "heartbeat_ack";
constexpr const char* kClipboardUpdate = "clipboard_update";
constexpr const char* kBrowserHandoff = "browser_handoff";
constexpr const char* kHeadsetHandoff = "headset_handoff";
constexpr const char* kPrepareHandoff = "prepare_handoff";
constexpr const char* kFileStart = "file_start";
constexpr const char* kFileEnd = "file_end";
constexpr const char* kNotificationUpdate = "notification_update";
} // namespace msg

enum class MessageKind {
    MobileConnect,
    Heartbeat,
    HeartbeatAck,
    ClipboardUpdate,
    BrowserHandoff,
    HeadsetHandoff,
    PrepareHandoff,
    FileStart,
    FileEnd,
    NotificationUpdate,
    Unknown,
};

// Decoded JSON control frame. `type` is empty when the tag is missing.
struct ControlMessage {
    std::string type;
    MessageKind kind = MessageKind::Unknown;
    nlohmann::json body;
};

struct FileStartInfo {
    std::string file_name;   // final path component only
    int64_t file_size = 0;
    int page_number = 1;     // defaults to 1 when absent
};

// Utilities
int64_t link_now_ms();                         // wall clock, ms since epoch
std::string link_make_client_id(int64_t now_ms);
MessageKind link_message_kind(const std::string& type);

// Builders (client -> host)
std::string link_make_handshake(int64_t now_ms, const std::string& client_id);
std::string link_make_heartbeat(int64_t now_ms);
std::string link_make_clipboard_update(const std::string& content);
std::string link_make_notification_update(const std::string& title,
                                          const std::string& content,
                                          const std::string& package_name);
std::string link_make_advertisement(const std::string& ip);

// Decoders. All return nullopt on malformed input; none throw.
std::optional<std::string> link_parse_advertisement(const std::string& datagram);
std::optional<ControlMessage> link_decode_control(const std::string& text);
std::optional<FileStartInfo> link_parse_file_start(const nlohmann::json& body);

// Optional string field; nullopt when absent or not a string
std::optional<std::string> link_string_field(const nlohmann::json& body, const char* key);

} // namespace kairoslink
