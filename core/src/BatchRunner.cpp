#include "romfetch/BatchRunner.hpp"
#include "romfetch/RuntimeLogging.hpp"

namespace romfetch {

BatchSummary runBatch(const std::vector<BatchTask> &tasks, CancelToken &cancel,
                      const BatchTaskRunner &runTask,
                      SelectionState &selection) {
    BatchSummary summary;
    summary.total = tasks.size();

    for (std::size_t i = 0; i < tasks.size() && runTask; ++i) {
        if (cancel.requested()) {
            summary.cancelled = true;
            break;
        }
        ++summary.attempted;
        const TransferState st = runTask(tasks[i], i + 1, tasks.size());
        if (st == TransferState::Succeeded) {
            ++summary.succeeded;
        } else if (st == TransferState::Cancelled) {
            summary.cancelled = true;
            break;
        } else {
            // The engine already cleaned up and reported this item.
            ++summary.failed;
        }
    }

    logMessage(LogLevel::Info,
               "Batch finished: " + std::to_string(summary.succeeded) + "/" +
                   std::to_string(summary.total) + " succeeded, " +
                   std::to_string(summary.failed) + " failed" +
                   (summary.cancelled ? ", cancelled" : ""));

    selection.reset();
    cancel.reset();
    return summary;
}

} // namespace romfetch
