// Streaming download of one remote file with live telemetry and cooperative
// cancellation. Runs on the transfer worker; the foreground reads the
// progress atomics for display.
#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace romfetch {

class NotificationBus;

enum class TransferState { Pending, Running, Succeeded, Failed, Cancelled };

const char *transferStateName(TransferState st);

inline bool isTerminal(TransferState st) {
    return st == TransferState::Succeeded || st == TransferState::Failed ||
           st == TransferState::Cancelled;
}

// Level-triggered cancel flag. Set by the foreground, observed by the worker
// between blocks.
class CancelToken {
public:
    void request() { flag_.store(true, std::memory_order_relaxed); }
    void reset() { flag_.store(false, std::memory_order_relaxed); }
    bool requested() const { return flag_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> flag_{false};
};

// Written by the worker, read by the foreground for presentation only.
struct TransferProgress {
    std::atomic<std::uint64_t> bytesRead{0};
    std::atomic<std::uint64_t> totalBytes{0};
    std::atomic<double> speed{0.0}; // bytes per second
    std::atomic<double> eta{0.0};   // seconds
    std::atomic<TransferState> state{TransferState::Pending};

    void reset();
    // 0..1; 0 while the size is unknown.
    double fraction() const;
};

struct DownloadOptions {
    std::size_t blockSize = 1024 * 1024;
    std::chrono::milliseconds rateWindow{500};
};

// Downloads `remote` into `local`, creating parent directories. Succeeds iff
// not cancelled and the whole file arrived (or the remote file is empty).
// Any other outcome removes the partial file, so afterwards `local` is either
// complete or absent. A failed removal is reported but does not change the
// returned state. Failures go to the bus and the log; nothing is thrown.
TransferState downloadFile(SftpClient &client, const std::string &remote,
                           const std::string &local, TransferProgress &progress,
                           const CancelToken &cancel, NotificationBus &bus,
                           const DownloadOptions &options = {});

} // namespace romfetch
