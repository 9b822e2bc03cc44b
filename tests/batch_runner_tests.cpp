// Result bookkeeping and sequential batch execution.
#include "TestSupport.hpp"
#include "romfetch/BatchRunner.hpp"
#include "romfetch/DownloadEngine.hpp"
#include "romfetch/NotificationBus.hpp"
#include "romfetch/RemoteSearch.hpp"

#include <filesystem>

using namespace std::chrono_literals;
using rftest::TestContext;
using romfetch::BatchTask;
using romfetch::CancelToken;
using romfetch::ResultSet;
using romfetch::SelectionState;
using romfetch::TransferState;

namespace fs = std::filesystem;

namespace {

ResultSet sampleResults() {
    return ResultSet::fromPaths(
        "ps1", "r", "/roms/ps1",
        romfetch::kDefaultSearchLimit,
        {"/roms/ps1/r1.bin", "/roms/ps1/r2.bin", "/roms/ps1/sub/r3.bin",
         "/roms/ps1/r4.bin"});
}

void test_result_labels(TestContext &t) {
    const ResultSet rs = sampleResults();
    t.check(rs.items.size() == 4, "four items");
    t.check(rs.items[2].label == "sub/r3.bin", "label is relative to the base");
    t.check(rs.items[2].remotePath == "/roms/ps1/sub/r3.bin",
            "remote path kept absolute");
    t.check(rs.find("r4.bin") != nullptr, "find by label");
    t.check(rs.find("missing") == nullptr, "unknown label not found");
}

void test_local_path(TestContext &t) {
    const fs::path p = romfetch::localPathFor("/data/dl", "ps1", "sub/r3.bin");
    t.check(p == fs::path("/data/dl") / "ps1" / "sub" / "r3.bin",
            "destination is <root>/<platform>/<label>");
    const fs::path q = romfetch::localPathFor("/data/dl", "ps1", "../../etc/x");
    t.check(q == fs::path("/data/dl") / "ps1" / "etc" / "x",
            "dot-dot segments cannot escape the platform directory");
}

void test_selection_toggle(TestContext &t) {
    SelectionState s;
    t.check(s.toggle("a"), "first toggle selects");
    t.check(s.contains("a"), "selected label present");
    t.check(!s.toggle("a"), "second toggle deselects");
    t.check(s.labels.empty(), "set empty after deselect");
    s.multiSelect = true;
    s.toggle("b");
    s.reset();
    t.check(!s.multiSelect && s.labels.empty(), "reset clears everything");
}

void test_batch_follows_result_order(TestContext &t) {
    const ResultSet rs = sampleResults();
    SelectionState s;
    s.multiSelect = true;
    s.toggle("r4.bin");
    s.toggle("r2.bin");
    const auto tasks = romfetch::buildBatch(rs, s, "/dl");
    t.check(tasks.size() == 2, "two tasks built");
    if (tasks.size() == 2) {
        t.check(tasks[0].label == "r2.bin" && tasks[1].label == "r4.bin",
                "batch keeps result order, not pick order");
    }
}

void test_run_sequential_success(TestContext &t) {
    const ResultSet rs = sampleResults();
    SelectionState s;
    s.multiSelect = true;
    s.toggle("r4.bin");
    s.toggle("r2.bin");
    const auto tasks = romfetch::buildBatch(rs, s, "/dl");

    CancelToken cancel;
    std::vector<std::string> seen;
    std::vector<std::size_t> indices;
    const auto summary = romfetch::runBatch(
        tasks, cancel,
        [&](const BatchTask &task, std::size_t index, std::size_t total) {
            seen.push_back(task.label);
            indices.push_back(index);
            t.check(total == 2, "total passed to each task");
            return TransferState::Succeeded;
        },
        s);
    t.check(seen == std::vector<std::string>({"r2.bin", "r4.bin"}),
            "tasks run in order");
    t.check(indices == std::vector<std::size_t>({1, 2}), "1-based indices");
    t.check(summary.succeeded == 2 && summary.failed == 0 && !summary.cancelled,
            "summary counts successes");
    t.check(!s.multiSelect && s.labels.empty(),
            "selection cleared after the batch");
}

void test_cancel_abandons_queue(TestContext &t) {
    std::vector<BatchTask> tasks{{"a", "/a", "/dl/a"},
                                 {"b", "/b", "/dl/b"},
                                 {"c", "/c", "/dl/c"}};
    SelectionState s;
    s.multiSelect = true;
    s.toggle("a");
    CancelToken cancel;
    int calls = 0;
    const auto summary = romfetch::runBatch(
        tasks, cancel,
        [&](const BatchTask &, std::size_t index, std::size_t) {
            ++calls;
            if (index == 2) {
                cancel.request();
                return TransferState::Cancelled;
            }
            return TransferState::Succeeded;
        },
        s);
    t.check(calls == 2, "no task runs after a cancellation");
    t.check(summary.cancelled, "summary records the cancellation");
    t.check(summary.succeeded == 1 && summary.attempted == 2,
            "counts reflect the attempted tasks");
    t.check(!cancel.requested(), "cancel token reset afterwards");
    t.check(!s.multiSelect && s.labels.empty(), "selection cleared on cancel");
}

void test_failure_moves_on(TestContext &t) {
    std::vector<BatchTask> tasks{{"a", "/a", "/dl/a"},
                                 {"b", "/b", "/dl/b"},
                                 {"c", "/c", "/dl/c"}};
    SelectionState s;
    CancelToken cancel;
    int calls = 0;
    const auto summary = romfetch::runBatch(
        tasks, cancel,
        [&](const BatchTask &, std::size_t index, std::size_t) {
            ++calls;
            return index == 1 ? TransferState::Failed : TransferState::Succeeded;
        },
        s);
    t.check(calls == 3, "a failed item does not stop the batch");
    t.check(summary.failed == 1 && summary.succeeded == 2,
            "summary counts failure and successes");
    t.check(!summary.cancelled, "failure is not a cancellation");
}

void test_batch_over_mock_backend(TestContext &t) {
    rftest::TempDir tmp;
    romfetch::MockSftpClient c;
    c.addFile("/roms/ps1/r1.bin", rftest::pattern(20));
    c.addFile("/roms/ps1/r2.bin", rftest::pattern(30));
    t.check(rftest::connectMock(c), "connect");

    const ResultSet rs = ResultSet::fromPaths(
        "ps1", "r", "/roms/ps1", 10, {"/roms/ps1/r1.bin", "/roms/ps1/r2.bin"});
    SelectionState s;
    s.multiSelect = true;
    s.toggle("r1.bin");
    s.toggle("r2.bin");
    const auto tasks = romfetch::buildBatch(rs, s, tmp.path().string());

    romfetch::NotificationBus bus(60s);
    romfetch::TransferProgress progress;
    CancelToken cancel;
    const auto summary = romfetch::runBatch(
        tasks, cancel,
        [&](const BatchTask &task, std::size_t, std::size_t) {
            return romfetch::downloadFile(c, task.remotePath, task.localPath,
                                          progress, cancel, bus);
        },
        s);
    t.check(summary.succeeded == 2, "both files downloaded");
    t.check(fs::file_size(tmp.path() / "ps1" / "r2.bin") == 30,
            "second file complete");
    t.check(c.maxConcurrentReaders() == 1,
            "never more than one transfer on the session");
}

} // namespace

int main() {
    TestContext t;
    test_result_labels(t);
    test_local_path(t);
    test_selection_toggle(t);
    test_batch_follows_result_order(t);
    test_run_sequential_success(t);
    test_cancel_abandons_queue(t);
    test_failure_moves_on(t);
    test_batch_over_mock_backend(t);
    return t.finish("batch_runner_tests");
}
