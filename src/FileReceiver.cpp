#include "FileReceiver.h"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <system_error>

namespace kairoslink {

namespace asio = boost::asio;
namespace fs = std::filesystem;

FileReceiver::FileReceiver(asio::io_context& io_ctx, std::string download_dir, ViewerFn view)
    : io(io_ctx), dir(std::move(download_dir)), viewer(std::move(view)) {}

FileReceiver::~FileReceiver() {
    close_sink();
}

void FileReceiver::on_file_start(const nlohmann::json& body) {
    // Unconditional reset; a transfer still in flight is dropped silently
    if (st.active) log("New file_start while a transfer is active; discarding previous transfer");
    ++generation;
    close_sink();
    st = FileTransferState{};
    st.active = true;
    overrun_logged = false;
    file_name.clear();

    if (body.is_object()) {
        auto page = body.find("page_number");
        if (page != body.end() && page->is_number_integer()) st.target_page = page->get<int>();
    }

    auto info = link_parse_file_start(body);
    if (!info) {
        log("Error: Invalid file_start message. Missing name or size.");
        st.active = false;
        return;
    }

    st.total_bytes = info->file_size;
    st.target_page = info->page_number;
    file_name = info->file_name;
    log("File transfer initiated: " + file_name + " (" + std::to_string(st.total_bytes)
        + " bytes, page " + std::to_string(st.target_page) + ")");
    publish(0.0, "Receiving file: " + file_name + "...");

    uint64_t gen = generation;
    std::weak_ptr<int> guard = alive;
    asio::post(io, [this, gen, guard] {
        if (guard.expired()) return;
        open_sink(gen);
    });
}

void FileReceiver::open_sink(uint64_t gen) {
    if (gen != generation || !st.active) return;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        log("Error creating download directory " + dir + ": " + ec.message());
        st.active = false;
        st.pending_chunks.clear();
        publish(progress(), "File transfer failed");
        return;
    }

    fs::path target = fs::path(dir) / file_name;
    st.path = target.string();

    sink.open(st.path, std::ios::binary | std::ios::trunc);
    if (!sink) {
        log("Error during file start/initialization: cannot open " + st.path);
        st.active = false;
        st.pending_chunks.clear();
        publish(progress(), "File transfer failed");
        return;
    }

    log("File sink is ready. Processing " + std::to_string(st.pending_chunks.size())
        + " buffered chunks.");
    for (const auto& chunk : st.pending_chunks) {
        if (!write_chunk(chunk)) return;
    }
    st.pending_chunks.clear();
    st.sink_open = true;
    publish_progress();
}

void FileReceiver::on_chunk(const std::vector<uint8_t>& chunk) {
    if (!st.active) {
        log("Chunk received but transfer not active. Discarding.");
        return;
    }

    if (!st.sink_open) {
        log("Sink not ready. Buffering chunk (" + std::to_string(chunk.size()) + " bytes).");
        st.pending_chunks.push_back(chunk);
        publish_progress();
        return;
    }

    if (!write_chunk(chunk)) return;
    publish_progress();
}

bool FileReceiver::write_chunk(const std::vector<uint8_t>& chunk) {
    sink.write(reinterpret_cast<const char*>(chunk.data()),
               static_cast<std::streamsize>(chunk.size()));
    if (!sink) {
        log("Error writing chunk to " + st.path + "; aborting transfer");
        close_sink();
        st.active = false;
        st.sink_open = false;
        st.pending_chunks.clear();
        publish(progress(), "File transfer failed");
        return false;
    }

    st.received_bytes += static_cast<int64_t>(chunk.size());
    if (st.received_bytes > st.total_bytes && !overrun_logged) {
        overrun_logged = true;
        log("Sender overran announced size: " + std::to_string(st.received_bytes) + "/"
            + std::to_string(st.total_bytes) + " bytes");
    }
    return true;
}

void FileReceiver::on_file_end() {
    if (!st.active) {
        log("File end received but transfer not active.");
        return;
    }

    if (!st.sink_open) {
        // file_end overtook the posted open; open now so buffered chunks land
        log("Sink still opening at file_end. Opening it now.");
        open_sink(generation);
        if (!st.active) return;
    }

    log("File transfer finished. Closing file sink.");
    ++generation;
    if (!finish_sink()) {
        log("Error flushing " + st.path + "; file is incomplete");
        st.active = false;
        st.sink_open = false;
        st.pending_chunks.clear();
        publish(progress(), "File transfer failed");
        return;
    }

    publish(1.0, "File received successfully. Opening...");

    std::error_code ec;
    if (!st.path.empty() && fs::exists(st.path, ec)) {
        log("Opening " + st.path + " at page " + std::to_string(st.target_page));
        if (viewer) viewer(st.path, st.target_page);
    } else {
        log("Failed to open file. Path: " + (st.path.empty() ? std::string("<none>") : st.path));
    }

    st.active = false;
    st.sink_open = false;
}

void FileReceiver::abort(const std::string& reason) {
    if (!st.active) return;
    log("File transfer aborted: " + reason);
    ++generation;
    close_sink();
    st.active = false;
    st.sink_open = false;
    st.pending_chunks.clear();
}

double FileReceiver::progress() const {
    if (st.total_bytes <= 0) return 0.0;
    double p = static_cast<double>(st.received_bytes) / static_cast<double>(st.total_bytes);
    return std::clamp(p, 0.0, 1.0);
}

void FileReceiver::close_sink() {
    if (!sink.is_open()) return;
    sink.flush();
    sink.close();
}

bool FileReceiver::finish_sink() {
    if (!sink.is_open()) return true;
    sink.flush();
    bool ok = !sink.fail();
    sink.close();
    return ok && !sink.fail();
}

void FileReceiver::publish(double value, const std::string& status) {
    if (progress_fn) progress_fn(value, status);
}

void FileReceiver::publish_progress() {
    double p = progress();
    int pct = static_cast<int>(std::lround(p * 100.0));
    publish(p, "Receiving file... " + std::to_string(pct) + "%");
}

} // namespace kairoslink
