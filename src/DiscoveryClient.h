#pragma once

#include "DebugLog.h"
#include "link_config.h"
#include "link_interfaces.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <array>
#include <cstdint>
#include <string>

namespace kairoslink {

// Listens on the discovery port for a host advertisement, bounded by a timeout.
class DiscoveryClient : public IPeerDiscovery {
public:
    DiscoveryClient(boost::asio::io_context& io, const DiscoveryArgs& args);
    ~DiscoveryClient() override;

    DiscoveryClient(const DiscoveryClient&) = delete;
    DiscoveryClient& operator=(const DiscoveryClient&) = delete;

    void start(FoundCallback on_found, FailedCallback on_failed) override;
    void cancel() override;

    void set_log_sink(LogSink sink) { log_ = std::move(sink); }
    bool listening() const { return active; }

private:
    bool bind_socket();
    void receive(uint64_t gen);
    void on_datagram(uint64_t gen, const boost::system::error_code& ec, size_t n);
    void fail(const std::string& reason);
    void close_socket();
    void log(const std::string& line) const { log_to(log_, "DiscoveryClient", line); }

private:
    boost::asio::io_context& io;
    DiscoveryArgs A;
    boost::asio::ip::udp::socket sock;
    boost::asio::steady_timer timer;
    boost::asio::ip::udp::endpoint from;
    std::array<char, 2048> buf{};
    FoundCallback found;
    FailedCallback failed;
    LogSink log_;
    uint64_t generation = 0;
    bool active = false;
};

} // namespace kairoslink
