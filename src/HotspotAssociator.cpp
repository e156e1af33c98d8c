#include "HotspotAssociator.h"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <exception>
#include <string>
#include <vector>

namespace kairoslink {

namespace asio = boost::asio;

HotspotAssociator::HotspotAssociator(asio::io_context& io_ctx, const HotspotArgs& args,
                                     IWifiControl& wifi_ctl)
    : io(io_ctx), A(args), wifi(wifi_ctl), timer(io_ctx) {}

HotspotAssociator::~HotspotAssociator() {
    cancel();
}

void HotspotAssociator::start(DoneCallback on_done) {
    cancel();
    done = std::move(on_done);
    active = true;
    uint64_t gen = generation;
    // First OS call runs on the next turn of the loop, never inside start()
    asio::post(io, [this, gen] { begin(gen); });
}

void HotspotAssociator::cancel() {
    ++generation;
    active = false;
    timer.cancel();
}

void HotspotAssociator::begin(uint64_t gen) {
    if (gen != generation || !active) return;

    try {
        auto current = wifi.current_ssid();
        log("Current SSID: " + current.value_or("null"));
        if (current && *current == A.ssid) {
            log("Already associated with " + A.ssid);
            finish(AssociationResult::Associated, "already associated");
            return;
        }

        log("Scanning for available networks...");
        std::vector<std::string> networks = wifi.scan();
        bool visible = std::find(networks.begin(), networks.end(), A.ssid) != networks.end();

        std::string names;
        for (const auto& n : networks) {
            if (!names.empty()) names += ", ";
            names += n;
        }
        log("Available networks: " + names);
        log(std::string("Fallback network found in scan: ") + (visible ? "true" : "false"));

        if (!visible) {
            finish(AssociationResult::NotFound, A.ssid + " not visible");
            return;
        }

        if (!wifi.disconnect()) log("Disconnect from current network reported failure");
    } catch (const std::exception& e) {
        log(std::string("Hotspot connection error: ") + e.what());
        finish(AssociationResult::Failed, e.what());
        return;
    }

    after(A.disconnect_settle, gen, [this, gen] { attempt(gen, 0); });
}

void HotspotAssociator::attempt(uint64_t gen, int index) {
    if (gen != generation || !active) return;

    bool ok = false;
    try {
        log("Hotspot connection attempt " + std::to_string(index + 1));
        ok = wifi.connect(A.ssid, A.password);
    } catch (const std::exception& e) {
        log(std::string("Hotspot connection error: ") + e.what());
        finish(AssociationResult::Failed, e.what());
        return;
    }

    if (ok) {
        log("Hotspot connection result: true");
        after(A.verify_settle, gen, [this, gen] { verify(gen); });
        return;
    }

    if (index + 1 >= A.connect_attempts) {
        log("Hotspot connection result: false");
        finish(AssociationResult::Failed,
               "failed to associate after " + std::to_string(A.connect_attempts) + " attempts");
        return;
    }

    after(A.retry_pause, gen, [this, gen, index] { attempt(gen, index + 1); });
}

void HotspotAssociator::verify(uint64_t gen) {
    if (gen != generation || !active) return;

    try {
        auto now = wifi.current_ssid();
        log("SSID after association: " + now.value_or("null"));
        if (now && *now == A.ssid) {
            finish(AssociationResult::Associated, "verified");
        } else {
            finish(AssociationResult::Failed, "SSID verification failed after association");
        }
    } catch (const std::exception& e) {
        log(std::string("Hotspot verification error: ") + e.what());
        finish(AssociationResult::Failed, e.what());
    }
}

// Every wait in the sequence shares the one timer; a stale wake-up is dropped
void HotspotAssociator::after(Millis delay, uint64_t gen, std::function<void()> step) {
    timer.expires_after(delay);
    timer.async_wait([this, gen, step = std::move(step)](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted || gen != generation) return;
        step();
    });
}

void HotspotAssociator::finish(AssociationResult result, const std::string& detail) {
    active = false;
    ++generation;
    auto cb = done;
    if (cb) cb(result, result == AssociationResult::Associated ? A.static_ip : std::string(), detail);
}

} // namespace kairoslink
