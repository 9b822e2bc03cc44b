// Interactive session: platform choice, search, result reuse, single and
// batch downloads. Drives a Frontend and owns the cached search state.
#pragma once
#include "BatchRunner.hpp"
#include "DownloadEngine.hpp"
#include "Frontend.hpp"
#include "MenuModel.hpp"
#include "RemoteSearch.hpp"
#include "SessionModel.hpp"
#include "SftpTypes.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace romfetch {

class ConnectionManager;
class NotificationBus;
class SftpClient;

enum class SessionStateId {
    PlatformSelect,
    ConfirmExit,
    QueryInput,
    ResultsList,
    ConfirmSingle,
    BatchRunning,
    PostAction,
    Finished
};

const char *sessionStateName(SessionStateId st);

struct SessionConfig {
    std::string remoteRoot = kRemoteRoot;
    std::string destRoot = "./downloads";
    std::size_t searchLimit = kDefaultSearchLimit;
    DownloadOptions download;
    std::chrono::milliseconds tick{33};
    std::size_t visibleRows = 10;
};

class SessionController {
public:
    // history() keeps only this many of the most recent states.
    static constexpr std::size_t kHistoryLimit = 32;

    SessionController(ConnectionManager &connections, Frontend &frontend,
                      NotificationBus &bus, SessionConfig config);

    // Connects, then runs the state machine until the user exits or a fatal
    // error occurs. Returns the process exit code.
    int run(const SessionOptions &opt);

    SessionStateId state() const { return state_; }
    const std::vector<SessionStateId> &history() const { return history_; }
    const std::optional<ResultSet> &results() const { return results_; }
    const SelectionState &selection() const { return selection_; }
    const std::string &platform() const { return platform_; }
    std::size_t searchCount() const { return searches_; }

private:
    enum class MenuAction { Chosen, Back, StartBatch, Quit };
    struct MenuResult {
        MenuAction action = MenuAction::Back;
        std::size_t index = 0;
    };
    struct MenuBehavior {
        bool allowBack = false;
        bool multiControls = false;
        std::optional<std::size_t> backIndex;
    };

    SessionStateId step(SessionStateId st);
    SessionStateId platformSelect();
    SessionStateId confirmExit();
    SessionStateId queryInput();
    SessionStateId resultsList();
    SessionStateId confirmSingle();
    SessionStateId batchRunning();
    SessionStateId postAction();
    SessionStateId fatal(const std::string &message);

    MenuResult runMenu(MenuModel &menu, const MenuBehavior &behavior);
    void toggleMultiSelect();
    TransferState runTransfer(const BatchTask &task, std::size_t index,
                              std::size_t total);
    void invalidateResults();
    void recordState(SessionStateId st);

    void renderMenu(const MenuModel &menu, const MenuBehavior &behavior);
    void renderProgress(const BatchTask &task, std::size_t index,
                        std::size_t total);
    void renderMessage(const std::string &footer);
    std::string menuFooter(const MenuBehavior &behavior) const;

    ConnectionManager &connections_;
    Frontend &frontend_;
    NotificationBus &bus_;
    SessionConfig config_;
    SftpClient *client_ = nullptr;

    SessionStateId state_ = SessionStateId::PlatformSelect;
    std::vector<SessionStateId> history_;
    int exitCode_ = 0;
    bool quitRequested_ = false;

    std::string platform_;
    std::optional<ResultSet> results_;
    SelectionState selection_;
    std::size_t pendingItem_ = 0;
    std::size_t searches_ = 0;

    CancelToken cancel_;
    TransferProgress progress_;
};

} // namespace romfetch
