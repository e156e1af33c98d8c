#pragma once

#include "DebugLog.h"
#include "link_interfaces.h"

#include <optional>
#include <string>

namespace kairoslink {

// IHostActions for a Linux desktop session: xdg-open for URLs and
// documents, xclip for the clipboard. Headset and hotspot requests are
// only recorded.
class DesktopActions : public IHostActions {
public:
    DesktopActions() = default;

    void write_clipboard(const std::string& text) override;
    std::optional<std::string> read_clipboard() override;
    void open_url(const std::string& url) override;
    void connect_headset(const std::string& name) override;
    void ensure_hotspot_on() override;
    void open_document(const std::string& path, int page) override;

    void set_log_sink(LogSink sink) { log_ = std::move(sink); }

private:
    void launch(const std::string& target);
    void log(const std::string& line) const { log_to(log_, "DesktopActions", line); }

    LogSink log_;
};

} // namespace kairoslink
