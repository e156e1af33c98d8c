#pragma once

#include "DebugLog.h"
#include "link_protocol.h"

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace kairoslink {

struct FileTransferState {
    bool active = false;
    int64_t total_bytes = 0;
    int64_t received_bytes = 0;
    int target_page = 1;
    std::vector<std::vector<uint8_t>> pending_chunks;   // arrival order
    bool sink_open = false;
    std::string path;
};

// Materializes one incoming file from file_start / binary chunks / file_end.
//
// The sink is opened on a posted task, so chunks can arrive before it is
// ready. Those are buffered in arrival order without counting them; once the
// sink opens they are written and counted first, then later chunks go
// straight to the sink. A new file_start discards whatever was in flight.
class FileReceiver {
public:
    using ViewerFn = std::function<void(const std::string& path, int page)>;
    using ProgressFn = std::function<void(double progress, const std::string& status)>;

    FileReceiver(boost::asio::io_context& io, std::string download_dir, ViewerFn viewer);
    ~FileReceiver();

    FileReceiver(const FileReceiver&) = delete;
    FileReceiver& operator=(const FileReceiver&) = delete;

    void on_file_start(const nlohmann::json& body);
    void on_chunk(const std::vector<uint8_t>& chunk);
    void on_file_end();

    // Drops an in-flight transfer (link loss, shutdown)
    void abort(const std::string& reason);

    // received / total, clamped to [0,1]; 0 when total is 0
    double progress() const;

    const FileTransferState& state() const { return st; }
    const std::string& download_dir() const { return dir; }

    void set_progress_callback(ProgressFn fn) { progress_fn = std::move(fn); }
    void set_log_sink(LogSink sink) { log_ = std::move(sink); }

private:
    void open_sink(uint64_t gen);
    bool write_chunk(const std::vector<uint8_t>& chunk);
    void close_sink();
    bool finish_sink();                       // false when buffered bytes never reached disk
    void publish(double value, const std::string& status);
    void publish_progress();
    void log(const std::string& line) const { log_to(log_, "FileReceiver", line); }

private:
    boost::asio::io_context& io;
    std::string dir;
    ViewerFn viewer;
    ProgressFn progress_fn;
    LogSink log_;
    FileTransferState st;
    std::ofstream sink;
    std::string file_name;
    uint64_t generation = 0;
    bool overrun_logged = false;
    std::shared_ptr<int> alive = std::make_shared<int>(0);
};

} // namespace kairoslink
