#pragma once

#include "DebugLog.h"
#include "link_config.h"
#include "link_interfaces.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace kairoslink {

// Joins the host's fallback access point and reports the host's static address.
//
// Sequence: already on the target SSID -> done. Otherwise scan; target absent
// -> NotFound. Otherwise drop the current network, settle, try to associate up
// to `connect_attempts` times with `retry_pause` between tries, settle again
// and re-read the SSID. Only a verified SSID counts as success. Nothing is
// retried beyond that; the caller decides what to do with a failure.
class HotspotAssociator : public IHotspotAssociator {
public:
    HotspotAssociator(boost::asio::io_context& io, const HotspotArgs& args, IWifiControl& wifi);
    ~HotspotAssociator() override;

    HotspotAssociator(const HotspotAssociator&) = delete;
    HotspotAssociator& operator=(const HotspotAssociator&) = delete;

    void start(DoneCallback on_done) override;
    void cancel() override;

    void set_log_sink(LogSink sink) { log_ = std::move(sink); }
    bool busy() const { return active; }

private:
    void begin(uint64_t gen);
    void attempt(uint64_t gen, int index);
    void verify(uint64_t gen);
    void after(Millis delay, uint64_t gen, std::function<void()> step);
    void finish(AssociationResult result, const std::string& detail);
    void log(const std::string& line) const { log_to(log_, "HotspotAssociator", line); }

private:
    boost::asio::io_context& io;
    HotspotArgs A;
    IWifiControl& wifi;
    boost::asio::steady_timer timer;
    DoneCallback done;
    LogSink log_;
    uint64_t generation = 0;
    bool active = false;
};

} // namespace kairoslink
