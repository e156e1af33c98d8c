#include "ConnectionService.h"
#include "DesktopActions.h"
#include "DiscoveryClient.h"
#include "HotspotAssociator.h"
#include "NmcliWifiControl.h"
#include "TransportSession.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <exception>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using kairoslink::LinkClientArgs;
using kairoslink::Millis;

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--bind X.Y.Z.W] [--discovery-port P] [--discovery-timeout-ms MS]"
              << " [--link-port P] [--path /ws] [--ssid NAME] [--password PW]"
              << " [--hotspot-ip X.Y.Z.W] [--iface IF] [--connect-timeout-ms MS]"
              << " [--heartbeat-ms MS] [--clipboard-ms MS] [--backoff 1,2,3,...]"
              << " [--max-attempts N] [--download-dir DIR]\n"
              << "Signals: SIGHUP forces a reconnect, SIGINT/SIGTERM stop.\n";
}

static std::vector<int> parse_backoff(const std::string& s) {
    std::vector<int> out;
    std::stringstream in(s);
    std::string item;
    while (std::getline(in, item, ',')) {
        int v = std::stoi(item);
        if (v < 0) throw std::invalid_argument("negative delay");
        out.push_back(v);
    }
    return out;
}

static bool parse_args(int argc, char** argv, LinkClientArgs& a) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string s = argv[i];
            auto need = [&](int more) {
                if (i + more >= argc) { usage(argv[0]); return false; }
                return true;
            };

            if (s == "--bind" && need(1)) a.discovery.bind_ip = argv[++i];
            else if (s == "--discovery-port" && need(1)) a.discovery.port = (uint16_t)std::stoi(argv[++i]);
            else if (s == "--discovery-timeout-ms" && need(1)) a.discovery.timeout = Millis(std::stoi(argv[++i]));
            else if (s == "--link-port" && need(1)) a.transport.port = (uint16_t)std::stoi(argv[++i]);
            else if (s == "--path" && need(1)) a.transport.path = argv[++i];
            else if (s == "--ssid" && need(1)) a.hotspot.ssid = argv[++i];
            else if (s == "--password" && need(1)) a.hotspot.password = argv[++i];
            else if (s == "--hotspot-ip" && need(1)) a.hotspot.static_ip = argv[++i];
            else if (s == "--iface" && need(1)) a.hotspot.iface = argv[++i];
            else if (s == "--connect-timeout-ms" && need(1)) a.connect_timeout = Millis(std::stoi(argv[++i]));
            else if (s == "--heartbeat-ms" && need(1)) a.heartbeat_period = Millis(std::stoi(argv[++i]));
            else if (s == "--clipboard-ms" && need(1)) a.clipboard_poll = Millis(std::stoi(argv[++i]));
            else if (s == "--backoff" && need(1)) a.reconnect.backoff_s = parse_backoff(argv[++i]);
            else if (s == "--max-attempts" && need(1)) a.reconnect.max_attempts = std::stoi(argv[++i]);
            else if (s == "--download-dir" && need(1)) a.download_dir = argv[++i];
            else if (s == "-h" || s == "--help") { usage(argv[0]); return false; }
            else { std::cerr << "Unknown arg: " << s << "\n"; usage(argv[0]); return false; }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid number: " << e.what() << "\n";
        usage(argv[0]);
        return false;
    }

    if (a.discovery.port == 0 || a.transport.port == 0) {
        std::cerr << "ports must be non-zero\n";
        return false;
    }
    if (a.reconnect.backoff_s.empty()) { std::cerr << "--backoff must list at least one delay\n"; return false; }
    if (a.reconnect.max_attempts < 0) { std::cerr << "--max-attempts must be >= 0\n"; return false; }
    if (a.connect_timeout.count() <= 0 || a.heartbeat_period.count() <= 0 ||
        a.discovery.timeout.count() <= 0) {
        std::cerr << "timeouts and periods must be >= 1 ms\n";
        return false;
    }
    if (a.clipboard_poll.count() < 0) { std::cerr << "--clipboard-ms must be >= 0\n"; return false; }
    if (a.transport.path.empty() || a.transport.path[0] != '/') {
        std::cerr << "--path must start with '/'\n";
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    LinkClientArgs args;
    if (!parse_args(argc, argv, args)) return 1;

    boost::asio::io_context io;

    try {
        kairoslink::DiscoveryClient discovery(io, args.discovery);
        kairoslink::NmcliWifiControl wifi(args.hotspot.iface);
        kairoslink::HotspotAssociator hotspot(io, args.hotspot, wifi);
        kairoslink::TransportSession transport(io, args.transport);
        kairoslink::DesktopActions actions;

        kairoslink::ConnectionService service(io, args, discovery, hotspot, transport, actions);
        discovery.set_log_sink(service.log_sink());
        wifi.set_log_sink(service.log_sink());
        hotspot.set_log_sink(service.log_sink());
        transport.set_log_sink(service.log_sink());
        actions.set_log_sink(service.log_sink());

        boost::asio::signal_set stop_signals(io, SIGINT, SIGTERM);
        stop_signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (ec) return;
            service.stop();
            io.stop();
        });

        boost::asio::signal_set retry_signal(io, SIGHUP);
        std::function<void()> wait_retry = [&] {
            retry_signal.async_wait([&](const boost::system::error_code& ec, int) {
                if (ec) return;
                service.force_reconnect();
                wait_retry();
            });
        };
        wait_retry();

        service.start();
        io.run();
    } catch (const std::invalid_argument& e) {
        std::cerr << "kairos_link: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "kairos_link: " << e.what() << "\n";
        return 3;
    }
    return 0;
}
