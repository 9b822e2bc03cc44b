// Session state machine driven by a scripted front-end over the mock backend.
#include "TestSupport.hpp"
#include "romfetch/ConnectionManager.hpp"
#include "romfetch/NotificationBus.hpp"
#include "romfetch/SessionController.hpp"

#include <deque>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;
using rftest::TestContext;
using romfetch::MockSftpClient;
using romfetch::NavCommand;
using romfetch::NotificationKind;
using romfetch::SessionStateId;

namespace fs = std::filesystem;

namespace {

// Replays menu commands and prompt answers. Commands queued for transfers are
// only handed out by the non-blocking polls made while a download runs.
class ScriptedFrontend : public romfetch::Frontend {
public:
    std::deque<NavCommand> menu;
    std::deque<NavCommand> transfer;
    std::deque<std::optional<std::string>> prompts;
    std::vector<romfetch::ScreenModel> screens;
    std::vector<std::string> promptsShown;

    void render(const romfetch::ScreenModel &screen) override {
        screens.push_back(screen);
    }

    bool nextCommand(std::chrono::milliseconds timeout,
                     NavCommand &cmd) override {
        if (timeout.count() == 0) {
            if (transfer.empty())
                return false;
            cmd = transfer.front();
            transfer.pop_front();
            return true;
        }
        // An exhausted script quits so a broken test cannot hang.
        if (menu.empty()) {
            cmd = NavCommand::Quit;
            return true;
        }
        cmd = menu.front();
        menu.pop_front();
        return true;
    }

    bool promptText(const std::string &prompt, std::string &out) override {
        promptsShown.push_back(prompt);
        if (prompts.empty() || !prompts.front()) {
            if (!prompts.empty())
                prompts.pop_front();
            return false;
        }
        out = *prompts.front();
        prompts.pop_front();
        return true;
    }

    bool sawMenu(const std::string &title) const {
        for (const auto &s : screens) {
            if (s.kind == romfetch::ScreenModel::Kind::Menu &&
                s.menu.title == title)
                return true;
        }
        return false;
    }
};

// Session view onto a mock the test keeps, so it survives the session close.
class BorrowedClient : public romfetch::SftpClient {
public:
    explicit BorrowedClient(MockSftpClient &m) : m_(m) {}
    bool connect(const romfetch::SessionOptions &opt, std::string &err) override {
        return m_.connect(opt, err);
    }
    void disconnect() override { m_.disconnect(); }
    bool isConnected() const override { return m_.isConnected(); }
    bool list(const std::string &p, std::vector<romfetch::FileInfo> &out,
              std::string &err) override {
        return m_.list(p, out, err);
    }
    bool stat(const std::string &p, romfetch::FileInfo &info,
              std::string &err) override {
        return m_.stat(p, info, err);
    }
    std::unique_ptr<romfetch::RemoteFileReader>
    openRead(const std::string &p, std::string &err) override {
        return m_.openRead(p, err);
    }

private:
    MockSftpClient &m_;
};

struct Fixture {
    rftest::TempDir tmp;
    MockSftpClient remote;
    romfetch::NotificationBus bus{60s};
    ScriptedFrontend ui;
    romfetch::ConnectionManager connections{
        [this] { return std::make_unique<BorrowedClient>(remote); }, bus};

    Fixture() {
        remote.addFile("/roms/ps1/a.bin", rftest::pattern(40));
        remote.addDirectory("/roms/ps1/sub");
        remote.addFile("/roms/ps1/sub/b.iso", rftest::pattern(50));
        remote.addFile("/roms/ps1/sub/B2.bin", rftest::pattern(60));
    }

    romfetch::SessionConfig config() const {
        romfetch::SessionConfig c;
        c.destRoot = tmp.path().string();
        c.tick = 1ms;
        c.visibleRows = 5;
        return c;
    }

    bool notified(const std::string &text, NotificationKind kind) const {
        for (const auto &n : bus.snapshot()) {
            if (n.kind == kind && n.message.find(text) != std::string::npos)
                return true;
        }
        return false;
    }

    std::string local(const std::string &rel) const {
        return (tmp.path() / "ps1" / rel).string();
    }
};

void test_wrong_credentials_exit(TestContext &t) {
    Fixture f;
    f.remote.requirePassword("right");
    romfetch::SessionController ctl(f.connections, f.ui, f.bus, f.config());
    auto opt = rftest::mockOptions();
    opt.password = std::string("wrong");

    t.check(ctl.run(opt) == 1, "connection failure exits with status 1");
    t.check(f.bus.size() == 1, "exactly one notification for the failure");
    t.check(f.notified("SFTP connection failed", NotificationKind::Error),
            "failure is an error notification");
    t.check(!ctl.results().has_value(), "no result set exists");
    t.check(ctl.history() ==
                std::vector<SessionStateId>({SessionStateId::Finished}),
            "no state beyond termination is entered");
    t.check(!f.ui.screens.empty() && f.ui.screens.back().kind ==
                                         romfetch::ScreenModel::Kind::Message,
            "a closing message is shown");
}

void test_no_platforms_is_fatal(TestContext &t) {
    Fixture f;
    MockSftpClient bare;
    bare.addDirectory("/roms");
    romfetch::NotificationBus bus(60s);
    romfetch::ConnectionManager cm(
        [&bare] { return std::make_unique<BorrowedClient>(bare); }, bus);
    romfetch::SessionController ctl(cm, f.ui, bus, f.config());
    t.check(ctl.run(rftest::mockOptions()) == 1, "no platforms exits with 1");
    bool found = false;
    for (const auto &n : bus.snapshot())
        found = found || n.message == "No platforms found on SFTP";
    t.check(found, "fatal reason is published");
    t.check(!bare.isConnected(), "session closed on exit");
}

void test_choose_another_file_reuses_results(TestContext &t) {
    Fixture f;
    f.ui.menu = {NavCommand::Confirm,                     // ps1
                 NavCommand::Confirm,                     // a.bin
                 NavCommand::MoveDown, NavCommand::Confirm, // Yes
                 NavCommand::Confirm,                     // Choose Another File
                 NavCommand::MoveDown, NavCommand::Confirm, // sub/b.iso
                 NavCommand::Confirm,                     // No
                 NavCommand::MoveUp, NavCommand::Confirm};  // Exit
    f.ui.prompts = {std::string("b")};
    romfetch::SessionController ctl(f.connections, f.ui, f.bus, f.config());

    t.check(ctl.run(rftest::mockOptions()) == 0, "normal exit status");
    t.check(ctl.searchCount() == 1, "returning to results does not search again");
    t.check(f.remote.listCalls("/roms/ps1") == 1, "tree walked once");
    t.check(ctl.results().has_value() && ctl.results()->items.size() == 3,
            "result set kept for reuse");
    t.check(rftest::readFile(f.local("a.bin")) == rftest::pattern(40),
            "chosen file downloaded under <dest>/<platform>");
    t.check(!fs::exists(f.local("sub/b.iso")), "declined file not downloaded");
    t.check(f.notified("Download complete: a.bin", NotificationKind::Success),
            "success notification");
    t.check(f.ui.sawMenu("Download 'sub/b.iso'?"), "confirmation names the label");
    t.check(!f.ui.promptsShown.empty() &&
                f.ui.promptsShown[0] == "Search in ps1 (ENTER to confirm)",
            "prompt names the platform");
    t.check(!f.remote.isConnected(), "session closed at exit");
}

void test_back_invalidates_results(TestContext &t) {
    Fixture f;
    f.ui.menu = {NavCommand::Confirm,  // ps1
                 NavCommand::Back,     // results -> new query
                 NavCommand::Back,     // platforms -> confirm exit
                 NavCommand::MoveDown, NavCommand::Confirm}; // Yes
    f.ui.prompts = {std::string("b"), std::nullopt};
    romfetch::SessionController ctl(f.connections, f.ui, f.bus, f.config());

    t.check(ctl.run(rftest::mockOptions()) == 0, "exit confirmed");
    t.check(!ctl.results().has_value(), "back discards the result set");
    const std::vector<SessionStateId> expected{
        SessionStateId::PlatformSelect, SessionStateId::QueryInput,
        SessionStateId::ResultsList,    SessionStateId::QueryInput,
        SessionStateId::PlatformSelect, SessionStateId::ConfirmExit,
        SessionStateId::Finished};
    t.check(ctl.history() == expected, "state sequence follows the back path");
    t.check(f.ui.sawMenu("Are you sure you want to exit the Downloader?"),
            "exit confirmation shown");
}

void test_results_back_entry(TestContext &t) {
    Fixture f;
    f.ui.menu = {NavCommand::Confirm,                         // ps1
                 NavCommand::MoveUp, NavCommand::Confirm,     // "< Back"
                 NavCommand::Quit};
    f.ui.prompts = {std::string("b"), std::nullopt};
    romfetch::SessionController ctl(f.connections, f.ui, f.bus, f.config());
    ctl.run(rftest::mockOptions());
    bool hadBack = false;
    for (const auto &s : f.ui.screens)
        hadBack = hadBack || (s.menu.title == "Results" &&
                              !s.menu.options.empty() &&
                              s.menu.options.back() == "< Back");
    t.check(hadBack, "results end with a back entry");
    t.check(f.ui.promptsShown.size() == 2, "back entry returns to the query");
}

void test_no_results_menu(TestContext &t) {
    Fixture f;
    f.ui.menu = {NavCommand::Confirm,  // ps1
                 NavCommand::Confirm,  // New Search
                 NavCommand::Quit};
    f.ui.prompts = {std::string("zzz"), std::nullopt};
    romfetch::SessionController ctl(f.connections, f.ui, f.bus, f.config());
    t.check(ctl.run(rftest::mockOptions()) == 0, "quit is a normal exit");
    t.check(f.notified("No results found.", NotificationKind::Info),
            "empty search is announced");
    t.check(f.ui.sawMenu("No results. What next?"), "follow-up menu shown");
    t.check(f.ui.promptsShown.size() == 2, "new search prompts again");
    t.check(ctl.searchCount() == 1, "one search performed");
}

void test_multi_select_batch(TestContext &t) {
    Fixture f;
    f.ui.menu = {NavCommand::Confirm,             // ps1
                 NavCommand::ToggleMultiSelect,
                 NavCommand::MoveDown, NavCommand::MoveDown,
                 NavCommand::Confirm,             // sub/B2.bin
                 NavCommand::MoveUp, NavCommand::MoveUp,
                 NavCommand::Confirm,             // a.bin
                 NavCommand::StartBatch,
                 NavCommand::MoveUp, NavCommand::Confirm}; // Exit
    f.ui.prompts = {std::string("b")};
    romfetch::SessionController ctl(f.connections, f.ui, f.bus, f.config());

    t.check(ctl.run(rftest::mockOptions()) == 0, "batch session exits cleanly");
    t.check(fs::exists(f.local("a.bin")) && fs::exists(f.local("sub/B2.bin")),
            "both selected files downloaded");
    t.check(!fs::exists(f.local("sub/b.iso")), "unselected file skipped");
    t.check(f.notified("Multi Select ON", NotificationKind::Info),
            "multi-select announced");
    t.check(f.notified("Selected: sub/B2.bin", NotificationKind::Info),
            "selection announced");
    t.check(f.notified("Multi Select OFF: selections cleared",
                       NotificationKind::Info),
            "batch end clears the selection");
    t.check(!ctl.selection().multiSelect && ctl.selection().labels.empty(),
            "selection state reset after the batch");
    t.check(f.remote.maxConcurrentReaders() == 1, "transfers never overlap");

    bool marked = false;
    for (const auto &s : f.ui.screens) {
        if (s.menu.title != "Results" || s.menu.marked.size() < 3)
            continue;
        marked = marked || (s.menu.marked[2] && !s.menu.marked[0]);
    }
    t.check(marked, "selected rows are marked on screen");
}

void test_toggle_off_clears_selection(TestContext &t) {
    Fixture f;
    f.ui.menu = {NavCommand::Confirm,           // ps1
                 NavCommand::ToggleMultiSelect,
                 NavCommand::Confirm,           // select a.bin
                 NavCommand::ToggleMultiSelect, // off
                 NavCommand::Quit};
    f.ui.prompts = {std::string("b")};
    romfetch::SessionController ctl(f.connections, f.ui, f.bus, f.config());
    ctl.run(rftest::mockOptions());
    t.check(f.notified("Selected: a.bin", NotificationKind::Info),
            "entry was selected");
    t.check(f.notified("Multi Select OFF: selections cleared",
                       NotificationKind::Info),
            "turning multi-select off clears the picks");
    t.check(ctl.selection().labels.empty() && !ctl.selection().multiSelect,
            "selection empty afterwards");
    t.check(!fs::exists(f.local("a.bin")), "nothing downloaded");
}

void test_start_batch_without_selection(TestContext &t) {
    Fixture f;
    f.ui.menu = {NavCommand::Confirm, NavCommand::ToggleMultiSelect,
                 NavCommand::StartBatch, NavCommand::Quit};
    f.ui.prompts = {std::string("b")};
    romfetch::SessionController ctl(f.connections, f.ui, f.bus, f.config());
    ctl.run(rftest::mockOptions());
    t.check(f.notified("No entries selected", NotificationKind::Info),
            "empty batch is refused");
    for (auto st : ctl.history())
        t.check(st != SessionStateId::BatchRunning, "no batch was started");
}

void test_cancel_single_download(TestContext &t) {
    Fixture f;
    f.remote.addFile("/roms/ps1/big.bin", rftest::pattern(2000));
    f.remote.setReadHook([](const std::string &, std::uint64_t) {
        std::this_thread::sleep_for(2ms);
    });
    f.ui.menu = {NavCommand::Confirm,                       // ps1
                 NavCommand::Confirm,                       // big.bin
                 NavCommand::MoveDown, NavCommand::Confirm, // Yes
                 NavCommand::MoveUp, NavCommand::Confirm};  // Exit
    f.ui.transfer = {NavCommand::Back};
    f.ui.prompts = {std::string("big")};
    auto cfg = f.config();
    cfg.download.blockSize = 10;
    romfetch::SessionController ctl(f.connections, f.ui, f.bus, cfg);

    t.check(ctl.run(rftest::mockOptions()) == 0, "cancel is not an error exit");
    t.check(!fs::exists(f.local("big.bin")), "cancelled file removed");
    t.check(f.notified("Download aborted by user", NotificationKind::Info),
            "cancellation announced");
    t.check(f.ui.sawMenu("What next?"), "post-download menu follows a cancel");

    bool progressShown = false;
    for (const auto &s : f.ui.screens) {
        if (s.kind == romfetch::ScreenModel::Kind::Progress) {
            progressShown = true;
            t.check(s.progress.label == "big.bin" && s.progress.total == 0,
                    "single download shows the file without batch counters");
        }
    }
    t.check(progressShown, "progress screen rendered while downloading");
}

void test_quit_during_batch(TestContext &t) {
    Fixture f;
    f.remote.setReadHook([](const std::string &, std::uint64_t) {
        std::this_thread::sleep_for(2ms);
    });
    f.ui.menu = {NavCommand::Confirm, NavCommand::ToggleMultiSelect,
                 NavCommand::Confirm, NavCommand::MoveDown, NavCommand::Confirm,
                 NavCommand::StartBatch};
    f.ui.transfer = {NavCommand::Quit};
    f.ui.prompts = {std::string("b")};
    auto cfg = f.config();
    cfg.download.blockSize = 4;
    romfetch::SessionController ctl(f.connections, f.ui, f.bus, cfg);

    t.check(ctl.run(rftest::mockOptions()) == 0, "quit exits normally");
    t.check(ctl.history().back() == SessionStateId::Finished, "finished");
    t.check(!fs::exists(f.local("a.bin")), "interrupted file removed");
    t.check(!fs::exists(f.local("sub/b.iso")), "queue abandoned after quit");
    t.check(!f.remote.isConnected(), "session closed");
}

void test_same_platform_searches_again(TestContext &t) {
    Fixture f;
    f.ui.menu = {NavCommand::Confirm, // ps1
                 NavCommand::Back,    // results -> new query (cancelled)
                 NavCommand::Confirm, // ps1 again
                 NavCommand::Quit};
    f.ui.prompts = {std::string("b"), std::nullopt, std::string("b")};
    romfetch::SessionController ctl(f.connections, f.ui, f.bus, f.config());

    t.check(ctl.run(rftest::mockOptions()) == 0, "quit exits normally");
    t.check(ctl.searchCount() == 2, "choosing a platform always asks again");
    t.check(f.ui.promptsShown.size() == 3, "query prompt shown every time");
}

void test_history_is_bounded(TestContext &t) {
    Fixture f;
    for (int i = 0; i < 40; ++i) {
        f.ui.menu.push_back(NavCommand::Back);    // platforms -> confirm exit
        f.ui.menu.push_back(NavCommand::Confirm); // No
    }
    f.ui.menu.push_back(NavCommand::Quit);
    romfetch::SessionController ctl(f.connections, f.ui, f.bus, f.config());

    t.check(ctl.run(rftest::mockOptions()) == 0, "quit exits normally");
    t.check(ctl.history().size() ==
                romfetch::SessionController::kHistoryLimit,
            "history keeps only the most recent states");
    t.check(ctl.history().back() == SessionStateId::Finished,
            "latest state is last");
}

// Fails the first progress render, as a broken display would.
class FailingProgressFrontend : public ScriptedFrontend {
public:
    void render(const romfetch::ScreenModel &screen) override {
        if (screen.kind == romfetch::ScreenModel::Kind::Progress)
            throw std::runtime_error("display lost");
        ScriptedFrontend::render(screen);
    }
};

void test_render_failure_cancels_transfer(TestContext &t) {
    Fixture f;
    FailingProgressFrontend ui;
    f.remote.addFile("/roms/ps1/big.bin", rftest::pattern(2000));
    f.remote.setReadHook([](const std::string &, std::uint64_t) {
        std::this_thread::sleep_for(2ms);
    });
    ui.menu = {NavCommand::Confirm,                        // ps1
               NavCommand::Confirm,                        // big.bin
               NavCommand::MoveDown, NavCommand::Confirm}; // Yes
    ui.prompts = {std::string("big")};
    auto cfg = f.config();
    cfg.download.blockSize = 10;
    romfetch::SessionController ctl(f.connections, ui, f.bus, cfg);

    bool threw = false;
    try {
        ctl.run(rftest::mockOptions());
    } catch (const std::runtime_error &) {
        threw = true;
    }
    t.check(threw, "front-end failure propagates");
    t.check(f.notified("Download aborted by user", NotificationKind::Info),
            "running download is cancelled while unwinding");
    t.check(!fs::exists(f.local("big.bin")), "interrupted file removed");
    f.connections.close();
}

} // namespace

int main() {
    TestContext t;
    test_wrong_credentials_exit(t);
    test_no_platforms_is_fatal(t);
    test_choose_another_file_reuses_results(t);
    test_back_invalidates_results(t);
    test_results_back_entry(t);
    test_no_results_menu(t);
    test_multi_select_batch(t);
    test_toggle_off_clears_selection(t);
    test_start_batch_without_selection(t);
    test_cancel_single_download(t);
    test_quit_during_batch(t);
    test_same_platform_searches_again(t);
    test_history_is_bounded(t);
    test_render_failure_cancels_transfer(t);
    return t.finish("session_controller_tests");
}
