// Sequential execution of a multi-file download over one session.
#pragma once
#include "DownloadEngine.hpp"
#include "SessionModel.hpp"
#include <cstddef>
#include <functional>
#include <vector>

namespace romfetch {

struct BatchSummary {
    std::size_t total = 0;
    std::size_t attempted = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    bool cancelled = false;
};

// Runs one task to a terminal state. `index` is 1-based.
using BatchTaskRunner = std::function<TransferState(
    const BatchTask &task, std::size_t index, std::size_t total)>;

// Executes `tasks` strictly one after another. A cancelled task abandons the
// rest of the queue; any other failure moves on to the next task. Whatever
// the outcome, the selection is cleared, multi-select turned off and the
// cancel token reset before returning.
BatchSummary runBatch(const std::vector<BatchTask> &tasks, CancelToken &cancel,
                      const BatchTaskRunner &runTask,
                      SelectionState &selection);

} // namespace romfetch
