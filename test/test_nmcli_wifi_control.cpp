#include "NmcliWifiControl.h"
#include "Subprocess.h"

#include <gtest/gtest.h>

#include <chrono>

using namespace kairoslink;

TEST(NmcliWifiControl, SplitsTerseFieldsAndUnescapes) {
    auto f = nmcli_split_terse(R"(yes:Cafe\: Upstairs:extra\\part)");
    ASSERT_EQ(f.size(), 3u);
    EXPECT_EQ(f[0], "yes");
    EXPECT_EQ(f[1], "Cafe: Upstairs");
    EXPECT_EQ(f[2], "extra\\part");

    auto empty = nmcli_split_terse("no:");
    ASSERT_EQ(empty.size(), 2u);
    EXPECT_TRUE(empty[1].empty());
}

TEST(NmcliWifiControl, PicksActiveSsid) {
    std::string out = "no:HomeNet\nyes:KAIROS_LINK\nno:Cafe\n";
    auto ssid = nmcli_active_ssid(out);
    ASSERT_TRUE(ssid.has_value());
    EXPECT_EQ(*ssid, "KAIROS_LINK");

    EXPECT_FALSE(nmcli_active_ssid("no:HomeNet\nno:Cafe\n").has_value());
    EXPECT_FALSE(nmcli_active_ssid("").has_value());
}

TEST(NmcliWifiControl, ListsDistinctNonEmptySsids) {
    auto list = nmcli_ssid_list("HomeNet\n\nKAIROS_LINK\nHomeNet\nA\\:B\n");
    EXPECT_EQ(list, (std::vector<std::string>{"HomeNet", "KAIROS_LINK", "A:B"}));
}

TEST(Subprocess, CapturesOutputAndExitCode) {
    auto r = run_process({"sh", "-c", "printf hello; exit 3"});
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.out, "hello");
}

TEST(Subprocess, FeedsStdin) {
    std::string input = "line one\nline two\n";
    ProcessArgs pa;
    pa.input = &input;
    auto r = run_process({"cat"}, pa);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.out, input);
}

TEST(Subprocess, MissingProgramFails) {
    auto r = run_process({"kairoslink-no-such-program"});
    EXPECT_EQ(r.exit_code, 127);
    EXPECT_TRUE(r.out.empty());

    EXPECT_EQ(run_process({}).exit_code, -1);
}

namespace {
long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count());
}
} // namespace

TEST(Subprocess, BackgroundedChildDoesNotHoldUpTheCaller) {
    std::string input = "clip";
    ProcessArgs pa;
    pa.input = &input;
    pa.capture_output = false;
    auto t0 = std::chrono::steady_clock::now();
    auto r = run_process({"sh", "-c", "cat >/dev/null; (sleep 3) & exit 0"}, pa);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_FALSE(r.timed_out);
    EXPECT_LT(elapsed_ms(t0), 1500);
}

TEST(Subprocess, CapturedOutputStopsWhenChildExits) {
    // the backgrounded sleep inherits the stdout pipe
    auto t0 = std::chrono::steady_clock::now();
    auto r = run_process({"sh", "-c", "printf ready; (sleep 3) & exit 0"});
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.out, "ready");
    EXPECT_LT(elapsed_ms(t0), 1500);
}

TEST(Subprocess, KillsChildAfterTimeout) {
    ProcessArgs pa;
    pa.timeout_ms = 200;
    auto t0 = std::chrono::steady_clock::now();
    auto r = run_process({"sleep", "5"}, pa);
    EXPECT_TRUE(r.timed_out);
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_LT(elapsed_ms(t0), 1500);
}

TEST(Subprocess, DetachedLaunchReturnsImmediately) {
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_TRUE(spawn_detached({"sh", "-c", "sleep 3"}));
    EXPECT_LT(elapsed_ms(t0), 1500);

    EXPECT_FALSE(spawn_detached({}));
}
