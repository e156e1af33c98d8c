#pragma once

#include "link_protocol.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace kairoslink {

using Millis = std::chrono::milliseconds;

struct DiscoveryArgs {
    uint16_t port = kDiscoveryPort;              // advertisement port
    std::string bind_ip = "0.0.0.0";             // any local interface
    Millis timeout{8000};                        // wait for first advertisement
};

struct HotspotArgs {
    std::string ssid = kHotspotSsid;             // fallback network identity
    std::string password = kHotspotPassword;     // WPA passphrase
    std::string static_ip = kHotspotIp;          // host address on that network
    std::string iface = "wlan0";                 // Wi-Fi interface (nmcli backend)
    int connect_attempts = 3;                    // association tries
    Millis disconnect_settle{1000};              // after dropping current network
    Millis retry_pause{2000};                    // between association tries
    Millis verify_settle{2000};                  // before re-reading the SSID
};

struct TransportArgs {
    uint16_t port = kLinkPort;                   // host WebSocket port
    std::string path = kLinkPath;                // WebSocket request path
};

struct ReconnectPolicy {
    std::vector<int> backoff_s = {1, 2, 3, 5, 5, 5, 5, 5, 5, 5};   // delay table (seconds)
    int max_attempts = 10;                                         // then give up
};

struct LinkClientArgs {
    DiscoveryArgs discovery;
    HotspotArgs hotspot;
    TransportArgs transport;
    ReconnectPolicy reconnect;
    Millis connect_timeout{10000};               // connecting -> reconnecting
    Millis heartbeat_period{5000};               // liveness ping
    Millis clipboard_poll{1000};                 // 0 disables outbound clipboard sync
    Millis backoff_unit{1000};                   // one backoff table step
    std::string download_dir;                    // empty: <tmp>/kairoslink
};

} // namespace kairoslink
