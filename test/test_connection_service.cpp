#include "ConnectionService.h"
#include "fakes.h"
#include "test_util.h"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace kairoslink;
using namespace kairoslink_test;

namespace {

class ConnectionServiceTest : public ::testing::Test {
protected:
    ConnectionServiceTest() : discovery(io, &trace), hotspot(io, &trace) {}

    LinkClientArgs fast_args() {
        LinkClientArgs a;
        a.connect_timeout = Millis(50);
        a.heartbeat_period = Millis(20);
        a.clipboard_poll = Millis(0);
        a.backoff_unit = Millis(1000);   // reconnects stay pending unless a test shortens this
        a.download_dir = dir.str();
        return a;
    }

    void make(const LinkClientArgs& a) {
        svc = std::make_unique<ConnectionService>(io, a, discovery, hotspot, transport, actions);
        svc->add_listener([this](const LinkEvent& e) {
            if (e.kind == LinkEvent::Kind::StateChanged) {
                states.push_back(e.state);
                if (e.state == ConnectionState::Reconnecting) {
                    reconnect_attempts.push_back(svc->fsm().attempts);
                    heartbeat_at_reconnect.push_back(svc->heartbeat_running());
                }
            } else if (e.kind == LinkEvent::Kind::Progress) {
                progress.push_back(e.progress);
            }
        });
    }

    void make() { make(fast_args()); }

    void connect() {
        svc->start();
        discovery.succeed("192.168.1.50");
        transport.text(R"({"type":"heartbeat_ack"})");
        ASSERT_EQ(svc->state(), ConnectionState::Connected);
    }

    boost::asio::io_context io;
    TempDir dir;
    std::vector<std::string> trace;
    FakeDiscovery discovery;
    FakeHotspot hotspot;
    FakeTransport transport;
    RecordingActions actions;

    std::vector<ConnectionState> states;
    std::vector<int> reconnect_attempts;
    std::vector<bool> heartbeat_at_reconnect;
    std::vector<double> progress;

    std::unique_ptr<ConnectionService> svc;
};

} // namespace

TEST_F(ConnectionServiceTest, InitialState) {
    make();
    EXPECT_EQ(svc->state(), ConnectionState::Disconnected);
    EXPECT_EQ(svc->status_message(), "Initializing...");
    EXPECT_FALSE(svc->peer().has_value());
    EXPECT_DOUBLE_EQ(svc->file_receive_progress(), 0.0);
}

TEST_F(ConnectionServiceTest, BroadcastDiscoveryTriedFirst) {
    make();
    svc->start();
    EXPECT_EQ(svc->state(), ConnectionState::Discovering);
    EXPECT_EQ(trace, (std::vector<std::string>{"broadcast"}));
    EXPECT_EQ(hotspot.starts, 0);
    EXPECT_EQ(svc->status_message(), "Searching on current WiFi network...");
}

TEST_F(ConnectionServiceTest, FirstInboundFrameCompletesConnection) {
    make();
    svc->start();
    discovery.succeed("192.168.1.50");

    EXPECT_EQ(svc->state(), ConnectionState::Connecting);
    ASSERT_EQ(transport.opened.size(), 1u);
    EXPECT_EQ(transport.opened[0].ip, "192.168.1.50");
    EXPECT_EQ(transport.opened[0].port, 8000);
    EXPECT_TRUE(svc->connect_timer_armed());

    transport.binary({0x01});
    EXPECT_EQ(svc->state(), ConnectionState::Connected);
    EXPECT_EQ(svc->fsm().attempts, 0);
    EXPECT_TRUE(svc->heartbeat_running());
    EXPECT_FALSE(svc->connect_timer_armed());
    EXPECT_EQ(svc->status_message(), "Connected! Ready for symbiotic link.");

    EXPECT_EQ(states, (std::vector<ConnectionState>{ConnectionState::Discovering,
                                                    ConnectionState::Connecting,
                                                    ConnectionState::Connected}));
}

TEST_F(ConnectionServiceTest, ConnectTimeoutSchedulesFirstBackoff) {
    auto a = fast_args();
    a.connect_timeout = Millis(20);
    make(a);
    svc->start();
    discovery.succeed("192.168.1.50");

    ASSERT_TRUE(run_until(io, [&] { return svc->state() == ConnectionState::Reconnecting; }));
    EXPECT_EQ(svc->fsm().attempts, 1);
    ASSERT_TRUE(svc->last_backoff_s().has_value());
    EXPECT_EQ(*svc->last_backoff_s(), 1);
    EXPECT_TRUE(svc->reconnect_pending());
    EXPECT_FALSE(svc->connect_timer_armed());
    EXPECT_FALSE(transport.is_open());
}

TEST_F(ConnectionServiceTest, HeartbeatSendFailureReconnectsInSameCallback) {
    make();
    connect();
    transport.throw_on_send = true;

    ASSERT_TRUE(run_until(io, [&] { return svc->state() == ConnectionState::Reconnecting; }));
    EXPECT_FALSE(svc->heartbeat_running());
    ASSERT_EQ(heartbeat_at_reconnect.size(), 1u);
    EXPECT_FALSE(heartbeat_at_reconnect[0]);
    EXPECT_EQ(svc->fsm().attempts, 1);
}

TEST_F(ConnectionServiceTest, HeartbeatsFlowWhileConnected) {
    make();
    connect();
    ASSERT_TRUE(run_until(io, [&] { return transport.count_sent("\"heartbeat\"") >= 2; }));
    EXPECT_EQ(svc->state(), ConnectionState::Connected);
}

TEST_F(ConnectionServiceTest, StreamCloseWhileConnectedSchedulesReconnect) {
    make();
    connect();
    transport.drop("stream closed by host");

    EXPECT_EQ(svc->state(), ConnectionState::Reconnecting);
    EXPECT_EQ(svc->fsm().attempts, 1);
    EXPECT_EQ(svc->status_message(), "Reconnecting... (1/10)");
    EXPECT_FALSE(svc->heartbeat_running());
}

TEST_F(ConnectionServiceTest, BackoffFireRestartsFromDiscovery) {
    auto a = fast_args();
    a.backoff_unit = Millis(1);
    make(a);
    connect();
    transport.drop("stream error");

    ASSERT_TRUE(run_until(io, [&] { return discovery.starts == 2; }));
    EXPECT_EQ(svc->state(), ConnectionState::Discovering);
    EXPECT_EQ(svc->fsm().attempts, 1);
    EXPECT_FALSE(svc->peer().has_value());

    discovery.succeed("192.168.1.51");
    transport.text(R"({"type":"heartbeat_ack"})");
    EXPECT_EQ(svc->state(), ConnectionState::Connected);
    EXPECT_EQ(svc->fsm().attempts, 0);
}

TEST_F(ConnectionServiceTest, GivesUpAfterTenScheduledReconnects) {
    auto a = fast_args();
    a.backoff_unit = Millis(1);
    make(a);
    discovery.auto_fail = true;
    hotspot.auto_result = AssociationResult::Failed;

    svc->start();
    ASSERT_TRUE(run_until(io, [&] {
        return reconnect_attempts.size() == 10 && svc->state() == ConnectionState::Disconnected;
    }));

    EXPECT_EQ(reconnect_attempts, (std::vector<int>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10}));
    EXPECT_EQ(svc->fsm().attempts, 0);
    EXPECT_FALSE(svc->fsm().tried_hotspot);
    EXPECT_FALSE(svc->reconnect_pending());
    EXPECT_EQ(svc->status_message(), "Connection failed. Tap refresh to retry.");

    // strategy order: broadcast first at 0, fallback first once the counter is 3
    ASSERT_GE(trace.size(), 5u);
    EXPECT_EQ(trace[0], "broadcast");
    EXPECT_EQ(trace[1], "hotspot");
    EXPECT_EQ(trace[2], "broadcast");
    EXPECT_EQ(trace[3], "broadcast");
    EXPECT_EQ(trace[4], "hotspot");

    int starts = discovery.starts + hotspot.starts;
    run_for(io, Millis(60));
    EXPECT_EQ(svc->state(), ConnectionState::Disconnected);
    EXPECT_EQ(discovery.starts + hotspot.starts, starts);

    discovery.auto_fail = false;
    svc->force_reconnect();
    EXPECT_EQ(svc->state(), ConnectionState::Discovering);
    EXPECT_EQ(svc->fsm().attempts, 0);
    EXPECT_EQ(trace.back(), "broadcast");
}

TEST_F(ConnectionServiceTest, HotspotAssociationYieldsStaticAddress) {
    make();
    svc->start();
    discovery.fail("timeout");

    EXPECT_EQ(hotspot.starts, 1);
    EXPECT_EQ(svc->state(), ConnectionState::Discovering);
    EXPECT_EQ(svc->status_message(), "Connecting to KAIROS Hotspot...");

    hotspot.finish(AssociationResult::Associated, "192.168.137.1");
    EXPECT_EQ(svc->state(), ConnectionState::Connecting);
    ASSERT_EQ(transport.opened.size(), 1u);
    EXPECT_EQ(transport.opened[0].ip, "192.168.137.1");
}

TEST_F(ConnectionServiceTest, HotspotNotFoundFallsBackToBroadcastThenBacksOff) {
    make();
    svc->start();
    discovery.fail("timeout");
    hotspot.finish(AssociationResult::NotFound);

    EXPECT_EQ(discovery.starts, 2);
    EXPECT_EQ(svc->state(), ConnectionState::Discovering);

    discovery.fail("timeout");
    EXPECT_EQ(hotspot.starts, 1);
    EXPECT_EQ(svc->state(), ConnectionState::Reconnecting);
    EXPECT_EQ(svc->fsm().attempts, 1);
}

TEST_F(ConnectionServiceTest, HotspotFailureSchedulesReconnect) {
    make();
    svc->start();
    discovery.fail("timeout");
    hotspot.finish(AssociationResult::Failed);

    EXPECT_EQ(svc->state(), ConnectionState::Reconnecting);
    EXPECT_EQ(svc->fsm().attempts, 1);
    EXPECT_TRUE(svc->fsm().tried_hotspot);
}

TEST_F(ConnectionServiceTest, LateDiscoveryCallbacksAreIgnored) {
    make();
    svc->start();
    auto stale_failed = discovery.failed;
    auto stale_found = discovery.found;
    discovery.succeed("192.168.1.50");
    transport.text(R"({"type":"heartbeat_ack"})");

    stale_failed("timeout");
    stale_found("10.9.9.9");
    EXPECT_EQ(svc->state(), ConnectionState::Connected);
    EXPECT_EQ(hotspot.starts, 0);
    EXPECT_EQ(transport.opened.size(), 1u);
}

TEST_F(ConnectionServiceTest, FramesOutsideConnectingAreIgnored) {
    make();
    svc->start();
    transport.text(R"({"type":"browser_handoff","url":"https://example.org"})");
    EXPECT_EQ(svc->state(), ConnectionState::Discovering);
    EXPECT_TRUE(actions.urls.empty());
}

TEST_F(ConnectionServiceTest, InboundControlMessagesAreRouted) {
    make();
    connect();
    transport.text(R"({"type":"browser_handoff","url":"https://example.org"})");
    transport.text("{broken");
    transport.text(R"({"type":"clipboard_update","content":"from host"})");
    transport.text(R"({"type":"headset_handoff","headset_name":"Buds"})");
    transport.text(R"({"type":"prepare_handoff"})");

    EXPECT_EQ(svc->state(), ConnectionState::Connected);
    EXPECT_EQ(actions.urls, (std::vector<std::string>{"https://example.org"}));
    EXPECT_EQ(actions.clipboard_writes, (std::vector<std::string>{"from host"}));
    EXPECT_EQ(actions.headsets, (std::vector<std::string>{"Buds"}));
    EXPECT_EQ(actions.hotspot_requests, 1);
}

TEST_F(ConnectionServiceTest, FileTransferOverTheLink) {
    make();
    connect();
    transport.text(R"({"type":"file_start","file_name":"a.pdf","file_size":100,"page_number":5})");
    transport.binary(std::vector<uint8_t>(60, 'a'));
    transport.binary(std::vector<uint8_t>(40, 'b'));
    EXPECT_EQ(svc->file_receiver().state().received_bytes, 0);

    ASSERT_TRUE(run_until(io, [&] { return svc->file_receiver().state().sink_open; }));
    transport.text(R"({"type":"file_end"})");

    auto path = dir.path() / "a.pdf";
    EXPECT_EQ(std::filesystem::file_size(path), 100u);
    EXPECT_DOUBLE_EQ(svc->file_receive_progress(), 1.0);
    ASSERT_FALSE(progress.empty());
    EXPECT_DOUBLE_EQ(progress.back(), 1.0);
    ASSERT_EQ(actions.documents.size(), 1u);
    EXPECT_EQ(actions.documents[0].path, path.string());
    EXPECT_EQ(actions.documents[0].page, 5);
    EXPECT_EQ(svc->status_message(), "File received successfully. Opening...");
}

TEST_F(ConnectionServiceTest, UnwritableDownloadFailsTransferButKeepsLink) {
    auto a = fast_args();
    a.download_dir = "/dev";
    make(a);
    connect();
    transport.text(R"({"type":"file_start","file_name":"full","file_size":100})");
    transport.binary(std::vector<uint8_t>(60, 'a'));
    transport.binary(std::vector<uint8_t>(40, 'b'));
    ASSERT_TRUE(run_until(io, [&] { return svc->file_receiver().state().sink_open; }));
    transport.text(R"({"type":"file_end"})");

    EXPECT_FALSE(svc->file_receiver().state().active);
    EXPECT_TRUE(actions.documents.empty());
    EXPECT_EQ(svc->status_message(), "File transfer failed");
    EXPECT_EQ(svc->state(), ConnectionState::Connected);
}

TEST_F(ConnectionServiceTest, LinkLossAbortsTransfer) {
    make();
    connect();
    transport.text(R"({"type":"file_start","file_name":"b.bin","file_size":10})");
    transport.binary(std::vector<uint8_t>(4, 'x'));
    transport.drop("stream error");

    EXPECT_FALSE(svc->file_receiver().state().active);
    EXPECT_TRUE(actions.documents.empty());
}

TEST_F(ConnectionServiceTest, OutboundMessagesOnlyWhileConnected) {
    make();
    EXPECT_FALSE(svc->send_message(nlohmann::json{{"type", "ping"}}));
    EXPECT_TRUE(transport.sent.empty());

    connect();
    EXPECT_TRUE(svc->send_notification("Mail", "New message", "com.example.mail"));
    EXPECT_EQ(transport.count_sent("\"notification_update\""), 1u);
    EXPECT_EQ(transport.count_sent("com.example.mail"), 1u);

    transport.send_ok = false;
    EXPECT_FALSE(svc->send_message(nlohmann::json{{"type", "ping"}}));
    EXPECT_EQ(svc->state(), ConnectionState::Reconnecting);
    EXPECT_EQ(svc->fsm().attempts, 1);
}

TEST_F(ConnectionServiceTest, LocalClipboardChangesAreSentOnce) {
    auto a = fast_args();
    a.clipboard_poll = Millis(5);
    make(a);
    actions.clipboard = std::string("local copy");
    connect();

    ASSERT_TRUE(run_until(io, [&] { return transport.count_sent("local copy") == 1; }));

    // content that came from the host is not echoed back
    transport.text(R"({"type":"clipboard_update","content":"from host"})");
    run_for(io, Millis(40));
    EXPECT_EQ(transport.count_sent("from host"), 0u);
    EXPECT_EQ(transport.count_sent("local copy"), 1u);
    EXPECT_GT(actions.clipboard_reads, 1);
}

TEST_F(ConnectionServiceTest, StopTearsEverythingDown) {
    make();
    connect();
    svc->stop();

    EXPECT_EQ(svc->state(), ConnectionState::Disconnected);
    EXPECT_EQ(svc->status_message(), "Stopped");
    EXPECT_FALSE(svc->heartbeat_running());
    EXPECT_FALSE(svc->reconnect_pending());
    EXPECT_FALSE(transport.is_open());

    run_for(io, Millis(60));
    EXPECT_EQ(svc->state(), ConnectionState::Disconnected);
    EXPECT_EQ(discovery.starts, 1);
    EXPECT_EQ(transport.count_sent("\"heartbeat\""), 0u);
}

TEST_F(ConnectionServiceTest, ForceReconnectFromConnected) {
    make();
    connect();
    transport.drop("stream error");
    ASSERT_EQ(svc->fsm().attempts, 1);

    svc->force_reconnect();
    EXPECT_EQ(svc->state(), ConnectionState::Discovering);
    EXPECT_EQ(svc->fsm().attempts, 0);
    EXPECT_FALSE(svc->reconnect_pending());
    EXPECT_EQ(discovery.starts, 2);
}

TEST_F(ConnectionServiceTest, DebugLogRecordsTransitions) {
    make();
    std::vector<std::string> lines;
    svc->add_listener([&](const LinkEvent& e) {
        if (e.kind == LinkEvent::Kind::Log) lines.push_back(e.text);
    });
    svc->start();

    std::string all = svc->debug_log().to_string();
    EXPECT_NE(all.find("Connection state changed: disconnected -> discovering"), std::string::npos);
    EXPECT_FALSE(lines.empty());
    EXPECT_EQ(lines.size(), svc->debug_log().size());

    svc->clear_debug_log();
    EXPECT_EQ(svc->debug_log().size(), 0u);
}

TEST_F(ConnectionServiceTest, RejectsEmptyBackoffTable) {
    auto a = fast_args();
    a.reconnect.backoff_s.clear();
    auto build = [&] { ConnectionService bad(io, a, discovery, hotspot, transport, actions); };
    EXPECT_THROW(build(), std::invalid_argument);
}
