#pragma once

#include "DebugLog.h"
#include "link_interfaces.h"

#include <optional>
#include <string>
#include <vector>

namespace kairoslink {

// Splits one line of `nmcli -t` output on unescaped ':' and removes the
// backslash escapes ("\:" and "\\").
std::vector<std::string> nmcli_split_terse(const std::string& line);

// SSID of the row marked active in `nmcli -t -f ACTIVE,SSID dev wifi`
std::optional<std::string> nmcli_active_ssid(const std::string& output);

// Non-empty, de-duplicated SSIDs from `nmcli -t -f SSID dev wifi list`
std::vector<std::string> nmcli_ssid_list(const std::string& output);

// IWifiControl on top of NetworkManager's command-line client
class NmcliWifiControl : public IWifiControl {
public:
    explicit NmcliWifiControl(std::string iface);

    std::optional<std::string> current_ssid() override;
    std::vector<std::string> scan() override;
    bool disconnect() override;
    bool connect(const std::string& ssid, const std::string& password) override;

    void set_log_sink(LogSink sink) { log_ = std::move(sink); }

private:
    void log(const std::string& line) const { log_to(log_, "NmcliWifiControl", line); }

    std::string iface;
    LogSink log_;
};

} // namespace kairoslink
