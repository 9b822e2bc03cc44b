#include "romfetch/TransferWorker.hpp"
#include "romfetch/RuntimeLogging.hpp"

#include <exception>

namespace romfetch {

TransferWorker::~TransferWorker() {
    if (thread_.joinable())
        thread_.join();
}

bool TransferWorker::start(Job job) {
    if (thread_.joinable() || !job)
        return false;
    std::packaged_task<TransferState()> task(std::move(job));
    future_ = task.get_future();
    thread_ = std::thread(std::move(task));
    return true;
}

bool TransferWorker::waitFor(std::chrono::milliseconds timeout) {
    if (!future_.valid())
        return true;
    return future_.wait_for(timeout) == std::future_status::ready;
}

TransferState TransferWorker::result() {
    if (thread_.joinable())
        thread_.join();
    if (!future_.valid())
        return TransferState::Failed;
    try {
        return future_.get();
    } catch (const std::exception &e) {
        logMessage(LogLevel::Critical,
                   std::string("Transfer worker failed: ") + e.what());
        return TransferState::Failed;
    }
}

} // namespace romfetch
