#include "LinkStateMachine.h"

#include <algorithm>

namespace kairoslink {

namespace {
constexpr int kHotspotFirstAfter = 2;   // counter above this tries fallback first
constexpr int kHotspotRetryFloor = 3;   // below this a second association is deferred
} // namespace

const char* to_string(ConnectionState s) {
    switch (s) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Discovering:  return "discovering";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
    }
    return "unknown";
}

const char* to_string(DiscoveryStrategy s) {
    switch (s) {
        case DiscoveryStrategy::Broadcast:       return "broadcast";
        case DiscoveryStrategy::FallbackHotspot: return "fallback-hotspot";
    }
    return "unknown";
}

LinkFsm fsm_with_state(LinkFsm f, ConnectionState s) {
    f.state = s;
    return f;
}

LinkFsm fsm_begin_cycle(LinkFsm f) {
    if (f.attempts == 0) f.tried_hotspot = false;
    f.hotspot_this_pass = false;
    f.state = ConnectionState::Discovering;
    return f;
}

DiscoveryStrategy fsm_select_strategy(const LinkFsm& f) {
    return f.attempts > kHotspotFirstAfter ? DiscoveryStrategy::FallbackHotspot
                                           : DiscoveryStrategy::Broadcast;
}

bool fsm_should_defer_hotspot(const LinkFsm& f) {
    if (f.hotspot_this_pass) return true;
    return f.tried_hotspot && f.attempts < kHotspotRetryFloor;
}

LinkFsm fsm_mark_hotspot_tried(LinkFsm f) {
    f.tried_hotspot = true;
    f.hotspot_this_pass = true;
    return f;
}

LinkFsm fsm_connected(LinkFsm f) {
    f.state = ConnectionState::Connected;
    f.attempts = 0;
    return f;
}

LinkFsm fsm_force_reconnect(LinkFsm f) {
    f.attempts = 0;
    f.tried_hotspot = false;
    f.hotspot_this_pass = false;
    return f;
}

int fsm_backoff_delay(const LinkFsm& f, const ReconnectPolicy& policy) {
    if (policy.backoff_s.empty()) return 0;
    int last = static_cast<int>(policy.backoff_s.size()) - 1;
    int idx = std::clamp(f.attempts, 0, last);
    return policy.backoff_s[static_cast<size_t>(idx)];
}

ReconnectDecision fsm_schedule_reconnect(LinkFsm f, const ReconnectPolicy& policy) {
    ReconnectDecision d;
    if (f.attempts >= policy.max_attempts) {
        f.state = ConnectionState::Disconnected;
        f.attempts = 0;
        f.tried_hotspot = false;
        f.hotspot_this_pass = false;
        d.next = f;
        return d;
    }

    d.delay_s = fsm_backoff_delay(f, policy);
    f.state = ConnectionState::Reconnecting;
    f.attempts += 1;
    d.next = f;
    return d;
}

} // namespace kairoslink
