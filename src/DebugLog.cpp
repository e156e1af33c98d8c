#include "DebugLog.h"

#include <ctime>
#include <iostream>

namespace kairoslink {

void log_to(const LogSink& sink, const char* component, const std::string& line) {
    if (sink) {
        sink(line);
        return;
    }
    std::cerr << component << ": " << line << "\n";
}

DebugLog::DebugLog(std::string prefix) : prefix_(std::move(prefix)) {}

std::string DebugLog::append(const std::string& message) {
    records_.push_back(DebugRecord{std::chrono::system_clock::now(), message});
    std::string line = format(records_.back());
    std::cerr << prefix_ << ": " << message << "\n";
    return line;
}

void DebugLog::clear() {
    records_.clear();
}

std::string DebugLog::to_string() const {
    std::string out;
    for (const auto& r : records_) {
        out += format(r);
        out += '\n';
    }
    return out;
}

std::string DebugLog::format(const DebugRecord& r) {
    std::time_t t = std::chrono::system_clock::to_time_t(r.at);
    std::tm tm{};
    localtime_r(&t, &tm);
    char stamp[16];
    std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &tm);
    return std::string("[") + stamp + "] " + r.message;
}

} // namespace kairoslink
