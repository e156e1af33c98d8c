#pragma once

#include "link_protocol.h"

#include <cstdint>
#include <netinet/in.h>
#include <string>

namespace kairoslink {

struct BeaconArgs {
    uint16_t port = kDiscoveryPort;               // advertisement port
    std::string advertise_ip;                     // empty: detect local address
    std::string broadcast_ip = "255.255.255.255"; // destination
    int interval_ms = 1000;                       // between advertisements
    int error_pause_ms = 5000;                    // after a failed send
    int count = 0;                                // 0: run until killed
};

// Primary IPv4 address of this host: the local end of a UDP socket
// "connected" towards a non-routed address. 127.0.0.1 when that fails.
std::string detect_local_ip();

// Host-side advertiser: broadcasts {"kairos_pc": true, "ip": ...} on the
// discovery port at a fixed interval.
class DiscoveryBeacon {
public:
    explicit DiscoveryBeacon(const BeaconArgs& args);
    ~DiscoveryBeacon();

    DiscoveryBeacon(const DiscoveryBeacon&) = delete;
    DiscoveryBeacon& operator=(const DiscoveryBeacon&) = delete;

    bool init();
    bool run();

    // One advertisement; false when the send failed
    bool send_once();

    const std::string& advertised_ip() const { return ip; }

private:
    BeaconArgs A;
    int fd = -1;
    sockaddr_in dest{};
    std::string ip;
    std::string payload;
};

} // namespace kairoslink
