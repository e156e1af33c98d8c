#include "DiscoveryClient.h"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>

#include <string>

namespace kairoslink {

namespace asio = boost::asio;
using boost::asio::ip::udp;

DiscoveryClient::DiscoveryClient(asio::io_context& io_ctx, const DiscoveryArgs& args)
    : io(io_ctx), A(args), sock(io_ctx), timer(io_ctx) {}

DiscoveryClient::~DiscoveryClient() {
    cancel();
}

void DiscoveryClient::start(FoundCallback on_found, FailedCallback on_failed) {
    cancel();
    found = std::move(on_found);
    failed = std::move(on_failed);
    active = true;
    uint64_t gen = generation;

    if (!bind_socket()) {
        // Report asynchronously so the caller never re-enters itself
        asio::post(io, [this, gen] {
            if (gen != generation || !active) return;
            fail("receiver setup failed");
        });
        return;
    }

    log("Listening for host advertisement on " + A.bind_ip + ":" + std::to_string(A.port));

    timer.expires_after(A.timeout);
    timer.async_wait([this, gen](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) return;
        if (gen != generation || !active) return;
        log("Discovery timeout after " + std::to_string(A.timeout.count()) + " ms");
        fail("timeout");
    });

    receive(gen);
}

void DiscoveryClient::cancel() {
    ++generation;
    active = false;
    timer.cancel();
    close_socket();
}

bool DiscoveryClient::bind_socket() {
    boost::system::error_code ec;
    auto addr = asio::ip::make_address(A.bind_ip, ec);
    if (ec) {
        log("Invalid bind address " + A.bind_ip + ": " + ec.message());
        return false;
    }

    sock.open(udp::v4(), ec);
    if (ec) { log("socket: " + ec.message()); return false; }

    sock.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) { log("setsockopt SO_REUSEADDR: " + ec.message()); close_socket(); return false; }

    sock.bind(udp::endpoint(addr, A.port), ec);
    if (ec) { log("bind: " + ec.message()); close_socket(); return false; }
    return true;
}

void DiscoveryClient::receive(uint64_t gen) {
    sock.async_receive_from(asio::buffer(buf), from,
        [this, gen](const boost::system::error_code& ec, size_t n) {
            on_datagram(gen, ec, n);
        });
}

void DiscoveryClient::on_datagram(uint64_t gen, const boost::system::error_code& ec, size_t n) {
    if (ec == asio::error::operation_aborted) return;
    if (gen != generation || !active) return;

    if (ec) {
        log("UDP listen error: " + ec.message());
        fail("receiver error");
        return;
    }

    std::string payload(buf.data(), n);
    log("Received datagram from " + from.address().to_string() + ": " + payload);

    auto ip = link_parse_advertisement(payload);
    if (!ip) {
        log("Not a host advertisement, ignoring");
        receive(gen);
        return;
    }

    active = false;
    timer.cancel();
    close_socket();
    ++generation;
    log("Host discovered at " + *ip);
    auto cb = found;
    if (cb) cb(*ip);
}

void DiscoveryClient::fail(const std::string& reason) {
    active = false;
    timer.cancel();
    close_socket();
    ++generation;
    auto cb = failed;
    if (cb) cb(reason);
}

void DiscoveryClient::close_socket() {
    if (!sock.is_open()) return;
    boost::system::error_code ec;
    sock.close(ec);
    if (ec) log("Error closing UDP receiver: " + ec.message());
}

} // namespace kairoslink
