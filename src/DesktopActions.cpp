#include "DesktopActions.h"

#include "Subprocess.h"

namespace kairoslink {

void DesktopActions::write_clipboard(const std::string& text) {
    // xclip forks a selection owner that outlives it; never read its stdout
    ProcessArgs pa;
    pa.input = &text;
    pa.capture_output = false;
    auto r = run_process({"xclip", "-selection", "clipboard"}, pa);
    if (r.exit_code != 0) log("xclip write failed, exit " + std::to_string(r.exit_code));
}

std::optional<std::string> DesktopActions::read_clipboard() {
    ProcessArgs pa;
    pa.timeout_ms = 1000;                  // polled from the event loop
    auto r = run_process({"xclip", "-selection", "clipboard", "-o"}, pa);
    if (r.exit_code != 0) return std::nullopt;
    return r.out;
}

void DesktopActions::open_url(const std::string& url) {
    log("Opening URL: " + url);
    launch(url);
}

void DesktopActions::connect_headset(const std::string& name) {
    log("Headset hand-off requested for " + name + " (pairing is handled outside this client)");
}

void DesktopActions::ensure_hotspot_on() {
    log("Host asked for the fallback hotspot (toggling is handled outside this client)");
}

void DesktopActions::open_document(const std::string& path, int page) {
    log("Opening " + path + " at page " + std::to_string(page));
    launch(path);
}

void DesktopActions::launch(const std::string& target) {
    if (!spawn_detached({"xdg-open", target})) log("xdg-open " + target + " could not be started");
}

} // namespace kairoslink
