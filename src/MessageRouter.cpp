#include "MessageRouter.h"

#include <exception>

namespace kairoslink {

namespace {

std::string preview(const std::string& s) {
    constexpr size_t kMax = 50;
    return s.size() > kMax ? s.substr(0, kMax) + "..." : s;
}

} // namespace

MessageRouter::MessageRouter(IHostActions& host) : actions(host) {}

bool MessageRouter::route(const ControlMessage& m) {
    try {
        switch (m.kind) {
            case MessageKind::Heartbeat:
            case MessageKind::HeartbeatAck:
                log("Heartbeat received - connection alive");
                return true;

            case MessageKind::ClipboardUpdate: {
                auto content = link_string_field(m.body, "content");
                if (!content) {
                    log("clipboard_update without content, dropped");
                    return false;
                }
                log("Clipboard update received: " + preview(*content));
                actions.write_clipboard(*content);
                return true;
            }

            case MessageKind::BrowserHandoff: {
                auto url = link_string_field(m.body, "url");
                log("Browser handoff received: " + url.value_or("null"));
                if (!url || url->empty()) return false;
                actions.open_url(*url);
                return true;
            }

            case MessageKind::HeadsetHandoff: {
                auto name = link_string_field(m.body, "headset_name");
                log("Headset handoff received: " + name.value_or("null"));
                if (!name || name->empty()) return false;
                actions.connect_headset(*name);
                return true;
            }

            case MessageKind::PrepareHandoff:
                log("Prepare handoff received");
                actions.ensure_hotspot_on();
                return true;

            default:
                log("Unknown message type: " + (m.type.empty() ? std::string("null") : m.type));
                return false;
        }
    } catch (const std::exception& e) {
        log("Error handling " + m.type + ": " + e.what());
        return false;
    }
}

} // namespace kairoslink
