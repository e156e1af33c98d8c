#include "link_protocol.h"

#include <chrono>
#include <filesystem>

namespace kairoslink {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;

int64_t link_now_ms() {
    auto now = Clock::now().time_since_epoch();
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count()
    );
}

std::string link_make_client_id(int64_t now_ms) {
    // Best-effort uniqueness only
    return std::string(kClientIdPrefix) + std::to_string(now_ms);
}

MessageKind link_message_kind(const std::string& type) {
    if (type == msg::kMobileConnect) return MessageKind::MobileConnect;
    if (type == msg::kHeartbeat) return MessageKind::Heartbeat;
    if (type == msg::kHeartbeatAck) return MessageKind::HeartbeatAck;
    if (type == msg::kClipboardUpdate) return MessageKind::ClipboardUpdate;
    if (type == msg::kBrowserHandoff) return MessageKind::BrowserHandoff;
    if (type == msg::kHeadsetHandoff) return MessageKind::HeadsetHandoff;
    if (type == msg::kPrepareHandoff) return MessageKind::PrepareHandoff;
    if (type == msg::kFileStart) return MessageKind::FileStart;
    if (type == msg::kFileEnd) return MessageKind::FileEnd;
    if (type == msg::kNotificationUpdate) return MessageKind::NotificationUpdate;
    return MessageKind::Unknown;
}

std::string link_make_handshake(int64_t now_ms, const std::string& client_id) {
    json j;
    j["type"] = msg::kMobileConnect;
    j["timestamp"] = now_ms;
    j["client_id"] = client_id;
    return j.dump();
}

std::string link_make_heartbeat(int64_t now_ms) {
    json j;
    j["type"] = msg::kHeartbeat;
    j["timestamp"] = now_ms;
    return j.dump();
}

std::string link_make_clipboard_update(const std::string& content) {
    json j;
    j["type"] = msg::kClipboardUpdate;
    j["content"] = content;
    return j.dump();
}

std::string link_make_notification_update(const std::string& title,
                                          const std::string& content,
                                          const std::string& package_name) {
    json j;
    j["type"] = msg::kNotificationUpdate;
    j["title"] = title;
    j["content"] = content;
    j["package_name"] = package_name;
    return j.dump();
}

std::string link_make_advertisement(const std::string& ip) {
    json j;
    j["kairos_pc"] = true;
    j["ip"] = ip;
    return j.dump();
}

std::optional<std::string> link_parse_advertisement(const std::string& datagram) {
    json j = json::parse(datagram, nullptr, /*allow_exceptions*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    auto flag = j.find("kairos_pc");
    if (flag == j.end() || !flag->is_boolean() || !flag->get<bool>()) return std::nullopt;

    auto ip = j.find("ip");
    if (ip == j.end() || !ip->is_string()) return std::nullopt;
    std::string addr = ip->get<std::string>();
    if (addr.empty()) return std::nullopt;
    return addr;
}

std::optional<ControlMessage> link_decode_control(const std::string& text) {
    json j = json::parse(text, nullptr, /*allow_exceptions*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    ControlMessage m;
    auto type = j.find("type");
    if (type != j.end() && type->is_string()) m.type = type->get<std::string>();
    m.kind = link_message_kind(m.type);
    m.body = std::move(j);
    return m;
}

std::optional<FileStartInfo> link_parse_file_start(const json& body) {
    auto name = body.find("file_name");
    auto size = body.find("file_size");
    if (name == body.end() || !name->is_string()) return std::nullopt;
    if (size == body.end() || !size->is_number_integer()) return std::nullopt;

    FileStartInfo info;
    info.file_name = std::filesystem::path(name->get<std::string>()).filename().string();
    if (info.file_name.empty() || info.file_name == "." || info.file_name == "..") {
        return std::nullopt;
    }
    info.file_size = size->get<int64_t>();
    if (info.file_size < 0) return std::nullopt;

    auto page = body.find("page_number");
    if (page != body.end() && page->is_number_integer()) info.page_number = page->get<int>();
    return info;
}

std::optional<std::string> link_string_field(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace kairoslink
