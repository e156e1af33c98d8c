#include "NmcliWifiControl.h"

#include "Subprocess.h"

#include <algorithm>
#include <sstream>

namespace kairoslink {

std::vector<std::string> nmcli_split_terse(const std::string& line) {
    std::vector<std::string> fields(1);
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\\' && i + 1 < line.size()) {
            fields.back().push_back(line[++i]);
        } else if (c == ':') {
            fields.emplace_back();
        } else {
            fields.back().push_back(c);
        }
    }
    return fields;
}

std::optional<std::string> nmcli_active_ssid(const std::string& output) {
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        auto f = nmcli_split_terse(line);
        if (f.size() >= 2 && f[0] == "yes" && !f[1].empty()) return f[1];
    }
    return std::nullopt;
}

std::vector<std::string> nmcli_ssid_list(const std::string& output) {
    std::vector<std::string> out;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        auto f = nmcli_split_terse(line);
        if (f.empty() || f[0].empty()) continue;
        if (std::find(out.begin(), out.end(), f[0]) == out.end()) out.push_back(f[0]);
    }
    return out;
}

NmcliWifiControl::NmcliWifiControl(std::string wifi_iface) : iface(std::move(wifi_iface)) {}

std::optional<std::string> NmcliWifiControl::current_ssid() {
    auto r = run_process({"nmcli", "-t", "-f", "ACTIVE,SSID", "dev", "wifi"});
    if (r.exit_code != 0) {
        log("nmcli status query failed, exit " + std::to_string(r.exit_code));
        return std::nullopt;
    }
    return nmcli_active_ssid(r.out);
}

std::vector<std::string> NmcliWifiControl::scan() {
    ProcessArgs pa;
    pa.timeout_ms = 15000;                 // a rescan takes a few seconds
    auto r = run_process({"nmcli", "-t", "-f", "SSID", "dev", "wifi", "list", "--rescan", "yes"}, pa);
    if (r.exit_code != 0) {
        log("nmcli scan failed, exit " + std::to_string(r.exit_code));
        return {};
    }
    auto ssids = nmcli_ssid_list(r.out);
    log("Scan found " + std::to_string(ssids.size()) + " networks");
    return ssids;
}

bool NmcliWifiControl::disconnect() {
    ProcessArgs pa;
    pa.capture_output = false;
    auto r = run_process({"nmcli", "dev", "disconnect", iface}, pa);
    if (r.exit_code != 0) log("nmcli disconnect " + iface + " failed, exit " + std::to_string(r.exit_code));
    return r.exit_code == 0;
}

bool NmcliWifiControl::connect(const std::string& ssid, const std::string& password) {
    ProcessArgs pa;
    pa.capture_output = false;
    pa.timeout_ms = 30000;                 // association plus DHCP
    auto r = run_process({"nmcli", "dev", "wifi", "connect", ssid, "password", password, "ifname", iface}, pa);
    if (r.exit_code != 0) {
        log("nmcli connect " + ssid + " failed, exit " + std::to_string(r.exit_code));
        return false;
    }
    return true;
}

} // namespace kairoslink
