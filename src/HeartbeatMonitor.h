#pragma once

#include "link_config.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <functional>

namespace kairoslink {

// Periodic liveness ping while connected. A failed send stops the timer and
// reports the failure; there is no ack tracking.
class HeartbeatMonitor {
public:
    using SendFn = std::function<bool()>;
    using FailureFn = std::function<void()>;

    HeartbeatMonitor(boost::asio::io_context& io, Millis period);
    ~HeartbeatMonitor();

    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

    void start(SendFn send, FailureFn on_failure);
    void stop();

    bool running() const { return active; }
    uint64_t beats() const { return sent; }

private:
    void arm(uint64_t gen);

private:
    boost::asio::steady_timer timer;
    Millis period;
    SendFn send_fn;
    FailureFn failure_fn;
    uint64_t generation = 0;
    uint64_t sent = 0;
    bool active = false;
};

} // namespace kairoslink
