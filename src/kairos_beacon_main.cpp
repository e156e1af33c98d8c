#include "DiscoveryBeacon.h"

#include <iostream>
#include <stdexcept>
#include <string>

using kairoslink::BeaconArgs;

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--port P] [--ip X.Y.Z.W] [--broadcast A.B.C.D] [--interval-ms MS] [--count N]\n";
}

static bool parse_args(int argc, char** argv, BeaconArgs& a) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string s = argv[i];
            auto need = [&](int more) {
                if (i + more >= argc) { usage(argv[0]); return false; }
                return true;
            };

            if (s == "--port" && need(1)) a.port = (uint16_t)std::stoi(argv[++i]);
            else if (s == "--ip" && need(1)) a.advertise_ip = argv[++i];
            else if (s == "--broadcast" && need(1)) a.broadcast_ip = argv[++i];
            else if (s == "--interval-ms" && need(1)) a.interval_ms = std::stoi(argv[++i]);
            else if (s == "--count" && need(1)) a.count = std::stoi(argv[++i]);
            else if (s == "-h" || s == "--help") { usage(argv[0]); return false; }
            else { std::cerr << "Unknown arg: " << s << "\n"; usage(argv[0]); return false; }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid number: " << e.what() << "\n";
        usage(argv[0]);
        return false;
    }

    if (a.port == 0) { std::cerr << "--port must be non-zero\n"; return false; }
    if (a.interval_ms <= 0) { std::cerr << "--interval-ms must be >= 1\n"; return false; }
    if (a.count < 0) { std::cerr << "--count must be >= 0\n"; return false; }
    return true;
}

int main(int argc, char** argv) {
    BeaconArgs args;
    if (!parse_args(argc, argv, args)) return 1;

    kairoslink::DiscoveryBeacon b(args);
    if (!b.init()) return 2;
    if (!b.run()) return 3;
    return 0;
}
