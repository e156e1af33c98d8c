#include "HeartbeatMonitor.h"

namespace kairoslink {

namespace asio = boost::asio;

HeartbeatMonitor::HeartbeatMonitor(asio::io_context& io, Millis p)
    : timer(io), period(p) {}

HeartbeatMonitor::~HeartbeatMonitor() {
    stop();
}

void HeartbeatMonitor::start(SendFn send, FailureFn on_failure) {
    stop();
    send_fn = std::move(send);
    failure_fn = std::move(on_failure);
    active = true;
    arm(generation);
}

void HeartbeatMonitor::stop() {
    ++generation;
    active = false;
    timer.cancel();
}

void HeartbeatMonitor::arm(uint64_t gen) {
    timer.expires_after(period);
    timer.async_wait([this, gen](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) return;
        if (gen != generation || !active) return;

        if (send_fn && send_fn()) {
            ++sent;
            if (gen == generation && active) arm(gen);
            return;
        }

        // send_fn may already have torn the link down and stopped us
        bool was_active = gen == generation && active;
        stop();
        auto cb = failure_fn;
        if (was_active && cb) cb();
    });
}

} // namespace kairoslink
