#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace kairoslink {

// Where components send diagnostic lines
using LogSink = std::function<void(const std::string& line)>;

// Writes "<component>: line" to stderr when no sink is installed
void log_to(const LogSink& sink, const char* component, const std::string& line);

struct DebugRecord {
    std::chrono::system_clock::time_point at;
    std::string message;
};

// Append-only, timestamped diagnostics trail. Not part of protocol correctness.
class DebugLog {
public:
    explicit DebugLog(std::string prefix = "ConnectionService");

    // Appends and mirrors "<prefix>: message" to stderr. Returns the rendered line.
    std::string append(const std::string& message);
    void clear();

    const std::vector<DebugRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }

    // One "[HH:MM:SS] message" line per record
    std::string to_string() const;

    static std::string format(const DebugRecord& r);

private:
    std::string prefix_;
    std::vector<DebugRecord> records_;
};

} // namespace kairoslink
