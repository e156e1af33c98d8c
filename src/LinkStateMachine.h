#pragma once

#include "link_config.h"

#include <optional>
#include <string>

namespace kairoslink {

enum class ConnectionState {
    Disconnected,
    Discovering,
    Connecting,
    Connected,
    Reconnecting,
};

enum class DiscoveryStrategy {
    Broadcast,          // listen for a host advertisement
    FallbackHotspot,    // associate with the host's access point
};

// Retry/backoff bookkeeping as a plain value. Every transition below is a
// pure function so the orchestrator's decisions can be tested without I/O.
struct LinkFsm {
    ConnectionState state = ConnectionState::Disconnected;
    int attempts = 0;              // ReconnectCounter, 0..max_attempts
    bool tried_hotspot = false;    // fallback attempted in this cycle
    bool hotspot_this_pass = false; // fallback attempted since the last begin_cycle
};

struct ReconnectDecision {
    LinkFsm next;
    std::optional<int> delay_s;    // nullopt: attempts exhausted, stay disconnected
};

const char* to_string(ConnectionState s);
const char* to_string(DiscoveryStrategy s);

LinkFsm fsm_with_state(LinkFsm f, ConnectionState s);

// Start of a discovery cycle (start, backoff fire, forced reconnect)
LinkFsm fsm_begin_cycle(LinkFsm f);

DiscoveryStrategy fsm_select_strategy(const LinkFsm& f);

// True when the fallback network was already tried this cycle and the
// counter is still low, or already tried in this pass; the caller backs off
// instead of re-associating.
bool fsm_should_defer_hotspot(const LinkFsm& f);
LinkFsm fsm_mark_hotspot_tried(LinkFsm f);

LinkFsm fsm_connected(LinkFsm f);
LinkFsm fsm_force_reconnect(LinkFsm f);

ReconnectDecision fsm_schedule_reconnect(LinkFsm f, const ReconnectPolicy& policy);

// Delay for the next scheduled reconnect given the current counter
int fsm_backoff_delay(const LinkFsm& f, const ReconnectPolicy& policy);

} // namespace kairoslink
