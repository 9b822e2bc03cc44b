// Download engine: stat, stream in fixed-size blocks, keep telemetry current
// and leave either a complete file or nothing behind.
#include "romfetch/DownloadEngine.hpp"
#include "romfetch/NotificationBus.hpp"
#include "romfetch/RuntimeLogging.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace romfetch {

namespace {

struct FileCloser {
    void operator()(std::FILE *f) const {
        if (f)
            std::fclose(f);
    }
};
using LocalFile = std::unique_ptr<std::FILE, FileCloser>;

constexpr double kMinSpeed = 1e-6;

} // namespace

const char *transferStateName(TransferState st) {
    switch (st) {
    case TransferState::Pending:
        return "Pending";
    case TransferState::Running:
        return "Running";
    case TransferState::Succeeded:
        return "Succeeded";
    case TransferState::Failed:
        return "Failed";
    case TransferState::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

void TransferProgress::reset() {
    bytesRead.store(0);
    totalBytes.store(0);
    speed.store(0.0);
    eta.store(0.0);
    state.store(TransferState::Pending);
}

double TransferProgress::fraction() const {
    const std::uint64_t total = totalBytes.load(std::memory_order_relaxed);
    if (total == 0)
        return 0.0;
    const std::uint64_t done = bytesRead.load(std::memory_order_relaxed);
    return std::min(1.0, static_cast<double>(done) / static_cast<double>(total));
}

TransferState downloadFile(SftpClient &client, const std::string &remote,
                           const std::string &local, TransferProgress &progress,
                           const CancelToken &cancel, NotificationBus &bus,
                           const DownloadOptions &options) {
    progress.reset();
    progress.state.store(TransferState::Running);
    const std::string displayName = fs::path(local).filename().string();

    auto finish = [&progress](TransferState st) {
        progress.speed.store(0.0);
        progress.state.store(st);
        return st;
    };
    // Leaves `local` absent. A failed removal is reported, nothing more.
    auto discardPartial = [&](bool afterError) {
        std::error_code ec;
        if (!fs::exists(local, ec))
            return;
        if (fs::remove(local, ec) && !ec) {
            bus.info(afterError ? "Removed partial file after error"
                                : "Removed partial file");
            return;
        }
        bus.error("Failed to remove partial file: " +
                  (ec ? ec.message() : std::string("unknown error")));
        logMessage(LogLevel::Warning, "Cleanup failed for " + local + ": " +
                                          (ec ? ec.message() : "unknown"));
    };
    auto fail = [&](const std::string &reason) {
        bus.error("Download failed: " + reason);
        logMessage(LogLevel::Warning,
                   "Download failed for " + remote + ": " + reason);
        discardPartial(true);
        return finish(TransferState::Failed);
    };

    FileInfo info;
    std::string err;
    if (!client.stat(remote, info, err))
        return fail(err.empty() ? "remote stat failed" : err);
    const std::uint64_t total = info.size;
    progress.totalBytes.store(total);

    const fs::path parent = fs::path(local).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec)
            return fail("cannot create " + parent.string() + ": " +
                        ec.message());
    }

    std::unique_ptr<RemoteFileReader> reader = client.openRead(remote, err);
    if (!reader)
        return fail(err.empty() ? "cannot open remote file" : err);

    LocalFile lf(std::fopen(local.c_str(), "wb"));
    if (!lf)
        return fail("cannot open local file for writing: " +
                    std::string(std::strerror(errno)));

    if (!reader->enableReadAhead())
        logMessage(LogLevel::Debug,
                   "Read-ahead unavailable, using sequential reads for " +
                       remote);

    using clock = std::chrono::steady_clock;
    std::vector<char> buf(std::max<std::size_t>(options.blockSize, 1));
    std::uint64_t done = 0;
    std::uint64_t windowBytes = 0;
    auto windowStart = clock::now();
    bool cancelled = false;
    std::string ioError;

    while (true) {
        // Cooperative cancellation point: one block of latency at most.
        if (cancel.requested()) {
            cancelled = true;
            bus.info("Download aborted by user");
            break;
        }
        const std::int64_t n = reader->read(buf.data(), buf.size(), err);
        if (n == 0)
            break;
        if (n < 0) {
            ioError = err.empty() ? "remote read failed" : err;
            break;
        }
        const auto len = static_cast<std::size_t>(n);
        if (std::fwrite(buf.data(), 1, len, lf.get()) != len) {
            ioError = "local write failed: " + std::string(std::strerror(errno));
            break;
        }
        done += len;
        progress.bytesRead.store(done, std::memory_order_relaxed);

        const auto now = clock::now();
        const auto elapsed = now - windowStart;
        if (elapsed >= options.rateWindow) {
            const double secs = std::chrono::duration<double>(elapsed).count();
            const double speed =
                secs > 0.0 ? static_cast<double>(done - windowBytes) / secs : 0.0;
            const std::uint64_t remaining = total > done ? total - done : 0;
            progress.speed.store(speed, std::memory_order_relaxed);
            progress.eta.store(static_cast<double>(remaining) /
                                   std::max(speed, kMinSpeed),
                               std::memory_order_relaxed);
            windowStart = now;
            windowBytes = done;
        }
    }
    reader.reset();

    std::FILE *raw = lf.release();
    if (std::fclose(raw) != 0 && ioError.empty() && !cancelled)
        ioError = "local close failed: " + std::string(std::strerror(errno));

    if (!ioError.empty())
        return fail(ioError);

    if (!cancelled && (total == 0 || done >= total)) {
        progress.eta.store(0.0);
        bus.success("Download complete: " + displayName);
        logMessage(LogLevel::Info, "Downloaded " + remote + " -> " + local +
                                       " (" + std::to_string(done) + " bytes)");
        return finish(TransferState::Succeeded);
    }

    if (cancelled) {
        logMessage(LogLevel::Info, "Download cancelled for " + remote);
        discardPartial(false);
        return finish(TransferState::Cancelled);
    }

    bus.error("Download incomplete: received " + std::to_string(done) +
              " of " + std::to_string(total) + " bytes");
    logMessage(LogLevel::Warning, "Short read for " + remote);
    discardPartial(false);
    return finish(TransferState::Failed);
}

} // namespace romfetch
