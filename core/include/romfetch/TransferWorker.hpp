// Background execution of a single transfer job, observed by the foreground
// through timed waits so it can keep rendering and accepting input.
#pragma once
#include "DownloadEngine.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <thread>

namespace romfetch {

class TransferWorker {
public:
    using Job = std::function<TransferState()>;

    TransferWorker() = default;
    ~TransferWorker();

    TransferWorker(const TransferWorker &) = delete;
    TransferWorker &operator=(const TransferWorker &) = delete;

    // Launches `job` on a new thread. Fails while a previous job is still
    // running or its result has not been collected.
    bool start(Job job);

    // Blocks for at most `timeout`. True once the job reached a terminal state.
    bool waitFor(std::chrono::milliseconds timeout);

    // Joins the thread and returns the job outcome. An exception escaping the
    // job is logged and reported as Failed.
    TransferState result();

    bool busy() const { return thread_.joinable(); }

private:
    std::thread thread_;
    std::future<TransferState> future_;
};

} // namespace romfetch
