#pragma once

#include "DebugLog.h"
#include "link_interfaces.h"
#include "link_protocol.h"

namespace kairoslink {

// Dispatches non-file control messages to the local collaborators.
// Unknown or malformed messages are logged and dropped.
class MessageRouter {
public:
    explicit MessageRouter(IHostActions& actions);

    // Returns true when the message was acted on (liveness counts)
    bool route(const ControlMessage& m);

    void set_log_sink(LogSink sink) { log_ = std::move(sink); }

private:
    void log(const std::string& line) const { log_to(log_, "MessageRouter", line); }

    IHostActions& actions;
    LogSink log_;
};

} // namespace kairoslink
