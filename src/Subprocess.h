#pragma once

#include <string>
#include <vector>

namespace kairoslink {

struct ProcessResult {
    int exit_code = -1;          // -1: could not be started, killed, or timed out
    bool timed_out = false;
    std::string out;             // captured stdout
};

struct ProcessArgs {
    const std::string* input = nullptr;   // written to stdin, then closed; else /dev/null
    bool capture_output = true;           // false: stdout goes to /dev/null
    int timeout_ms = 3000;                // then the child is killed
};

// Runs argv[0] from PATH with the given arguments (no shell) and waits for
// it, never longer than `timeout_ms`. Output left open by a backgrounded
// grandchild does not extend the wait.
ProcessResult run_process(const std::vector<std::string>& argv, const ProcessArgs& args = ProcessArgs{});

// Starts argv[0] fully detached (double fork, stdin/stdout on /dev/null)
// and returns once the intermediate child is reaped. False only when the
// launch itself failed.
bool spawn_detached(const std::vector<std::string>& argv);

} // namespace kairoslink
