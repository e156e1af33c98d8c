#include "Subprocess.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <iostream>

namespace kairoslink {

using Clock = std::chrono::steady_clock;

namespace {

void close_fd(int& fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

bool write_all(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

std::vector<char*> exec_args(const std::vector<std::string>& argv) {
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);
    return args;
}

// Child side: only async-signal-safe calls until exec
[[noreturn]] void exec_child(char** args, int in_fd, int out_fd) {
    int null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    ::dup2(in_fd >= 0 ? in_fd : null_fd, STDIN_FILENO);
    ::dup2(out_fd >= 0 ? out_fd : null_fd, STDOUT_FILENO);
    ::execvp(args[0], args);
    _exit(127);
}

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessArgs& a) {
    ProcessResult r;
    if (argv.empty()) {
        std::cerr << "run_process: empty argv\n";
        return r;
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    if (a.input && ::pipe2(in_pipe, O_CLOEXEC) < 0) { perror("pipe"); return r; }
    if (a.capture_output && ::pipe2(out_pipe, O_CLOEXEC) < 0) {
        perror("pipe");
        close_fd(in_pipe[0]);
        close_fd(in_pipe[1]);
        return r;
    }

    auto args = exec_args(argv);
    auto deadline = Clock::now() + std::chrono::milliseconds(a.timeout_ms);

    pid_t pid = ::fork();
    if (pid < 0) {
        perror("fork");
        close_fd(in_pipe[0]);
        close_fd(in_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return r;
    }
    if (pid == 0) exec_child(args.data(), in_pipe[0], out_pipe[1]);

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);

    if (a.input) {
        // A child that exits without reading stdin must not kill us with SIGPIPE
        struct sigaction ign{}, old{};
        ign.sa_handler = SIG_IGN;
        ::sigaction(SIGPIPE, &ign, &old);
        if (!write_all(in_pipe[1], *a.input)) perror("write stdin");
        close_fd(in_pipe[1]);
        ::sigaction(SIGPIPE, &old, nullptr);
    }

    // Read until EOF or until the child is gone and nothing more is
    // buffered; a grandchild holding the pipe open is not waited for.
    int status = 0;
    bool reaped = false;
    char buf[4096];
    for (;;) {
        if (!reaped && remaining_ms(deadline) == 0) {
            r.timed_out = true;
            std::cerr << "run_process: " << argv[0] << " timed out after " << a.timeout_ms << " ms\n";
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            break;
        }
        pollfd p{out_pipe[0], POLLIN, 0};
        int slice = reaped ? 0 : std::min(20, remaining_ms(deadline));
        int rc = out_pipe[0] >= 0 ? ::poll(&p, 1, slice) : ::poll(nullptr, 0, slice);
        if (rc < 0 && errno == EINTR) continue;

        if (rc > 0) {
            ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
            if (n > 0) { r.out.append(buf, static_cast<size_t>(n)); continue; }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0) perror("read stdout");
            close_fd(out_pipe[0]);   // EOF or error: only the exit status is left
            if (reaped) break;
            continue;
        }

        if (reaped) break;
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) { reaped = true; continue; }
        if (w < 0 && errno != EINTR) { perror("waitpid"); break; }
    }
    close_fd(out_pipe[0]);

    if (!r.timed_out && reaped && WIFEXITED(status)) r.exit_code = WEXITSTATUS(status);
    return r;
}

bool spawn_detached(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        std::cerr << "spawn_detached: empty argv\n";
        return false;
    }

    auto args = exec_args(argv);
    pid_t pid = ::fork();
    if (pid < 0) { perror("fork"); return false; }

    if (pid == 0) {
        ::setsid();
        pid_t grandchild = ::fork();
        if (grandchild != 0) _exit(grandchild < 0 ? 1 : 0);
        exec_child(args.data(), -1, -1);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) { perror("waitpid"); return false; }
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

} // namespace kairoslink
