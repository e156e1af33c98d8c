#include "DiscoveryBeacon.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <iostream>
#include <thread>

namespace kairoslink {

std::string detect_local_ip() {
    const std::string fallback = "127.0.0.1";

    int s = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (s < 0) { perror("socket"); return fallback; }

    sockaddr_in route{};
    route.sin_family = AF_INET;
    route.sin_port = htons(1);
    inet_pton(AF_INET, "10.255.255.255", &route.sin_addr);

    std::string out = fallback;
    if (::connect(s, (sockaddr*)&route, sizeof(route)) == 0) {
        sockaddr_in local{};
        socklen_t len = sizeof(local);
        char buf[INET_ADDRSTRLEN] = {0};
        if (getsockname(s, (sockaddr*)&local, &len) == 0 &&
            local.sin_addr.s_addr != htonl(INADDR_ANY) &&
            inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf))) {
            out = buf;
        }
    }
    ::close(s);
    return out;
}

DiscoveryBeacon::DiscoveryBeacon(const BeaconArgs& args) : A(args) {}

DiscoveryBeacon::~DiscoveryBeacon() {
    if (fd >= 0) ::close(fd);
}

bool DiscoveryBeacon::init() {
    fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) { perror("socket"); return false; }

    int on = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) < 0) {
        perror("setsockopt SO_BROADCAST");
        return false;
    }

    std::memset(&dest, 0, sizeof(dest));
    dest.sin_family = AF_INET;
    dest.sin_port = htons(A.port);
    if (inet_pton(AF_INET, A.broadcast_ip.c_str(), &dest.sin_addr) != 1) {
        std::cerr << "Invalid --broadcast IP: " << A.broadcast_ip << "\n";
        return false;
    }

    ip = A.advertise_ip.empty() ? detect_local_ip() : A.advertise_ip;
    payload = link_make_advertisement(ip);

    std::cerr << "Advertising " << ip << " to " << A.broadcast_ip << ":" << A.port
              << " every " << A.interval_ms << " ms\n";
    return true;
}

bool DiscoveryBeacon::send_once() {
    ssize_t n = ::sendto(fd, payload.data(), payload.size(), 0, (sockaddr*)&dest, sizeof(dest));
    if (n < 0) { perror("sendto"); return false; }
    return true;
}

bool DiscoveryBeacon::run() {
    if (fd < 0) {
        std::cerr << "DiscoveryBeacon: run() before init()\n";
        return false;
    }

    for (int sent = 0; A.count == 0 || sent < A.count; ++sent) {
        if (send_once()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(A.interval_ms));
        } else {
            std::cerr << "Broadcast error, retrying in " << A.error_pause_ms << " ms\n";
            std::this_thread::sleep_for(std::chrono::milliseconds(A.error_pause_ms));
        }
    }
    return true;
}

} // namespace kairoslink
