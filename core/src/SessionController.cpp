// Session state machine. Each state is a blocking step that renders through
// the Frontend and returns the next state.
#include "romfetch/SessionController.hpp"
#include "romfetch/ConnectionManager.hpp"
#include "romfetch/NotificationBus.hpp"
#include "romfetch/RuntimeLogging.hpp"
#include "romfetch/TransferWorker.hpp"

namespace romfetch {

namespace {

const char *const kBackLabel = "< Back";

std::string baseName(const std::string &label) {
    const auto slash = label.rfind('/');
    return slash == std::string::npos ? label : label.substr(slash + 1);
}

} // namespace

const char *navCommandName(NavCommand cmd) {
    switch (cmd) {
    case NavCommand::MoveUp:
        return "MoveUp";
    case NavCommand::MoveDown:
        return "MoveDown";
    case NavCommand::MoveLeft:
        return "MoveLeft";
    case NavCommand::MoveRight:
        return "MoveRight";
    case NavCommand::Confirm:
        return "Confirm";
    case NavCommand::Back:
        return "Back";
    case NavCommand::ToggleMultiSelect:
        return "ToggleMultiSelect";
    case NavCommand::StartBatch:
        return "StartBatch";
    case NavCommand::Quit:
        return "Quit";
    }
    return "Unknown";
}

const char *sessionStateName(SessionStateId st) {
    switch (st) {
    case SessionStateId::PlatformSelect:
        return "PlatformSelect";
    case SessionStateId::ConfirmExit:
        return "ConfirmExit";
    case SessionStateId::QueryInput:
        return "QueryInput";
    case SessionStateId::ResultsList:
        return "ResultsList";
    case SessionStateId::ConfirmSingle:
        return "ConfirmSingle";
    case SessionStateId::BatchRunning:
        return "BatchRunning";
    case SessionStateId::PostAction:
        return "PostAction";
    case SessionStateId::Finished:
        return "Finished";
    }
    return "Unknown";
}

SessionController::SessionController(ConnectionManager &connections,
                                     Frontend &frontend, NotificationBus &bus,
                                     SessionConfig config)
    : connections_(connections), frontend_(frontend), bus_(bus),
      config_(std::move(config)) {}

int SessionController::run(const SessionOptions &opt) {
    history_.clear();
    exitCode_ = 0;
    quitRequested_ = false;

    std::string err;
    client_ = connections_.open(opt, err);
    if (!client_) {
        state_ = SessionStateId::Finished;
        recordState(state_);
        exitCode_ = 1;
        renderMessage("Could not connect. Exiting...");
        return exitCode_;
    }

    state_ = SessionStateId::PlatformSelect;
    recordState(state_);
    while (state_ != SessionStateId::Finished) {
        const SessionStateId next = step(state_);
        logMessage(LogLevel::Debug, std::string("Session ") +
                                        sessionStateName(state_) + " -> " +
                                        sessionStateName(next));
        state_ = next;
        recordState(state_);
    }

    connections_.close();
    client_ = nullptr;
    return exitCode_;
}

SessionStateId SessionController::step(SessionStateId st) {
    switch (st) {
    case SessionStateId::PlatformSelect:
        return platformSelect();
    case SessionStateId::ConfirmExit:
        return confirmExit();
    case SessionStateId::QueryInput:
        return queryInput();
    case SessionStateId::ResultsList:
        return resultsList();
    case SessionStateId::ConfirmSingle:
        return confirmSingle();
    case SessionStateId::BatchRunning:
        return batchRunning();
    case SessionStateId::PostAction:
        return postAction();
    case SessionStateId::Finished:
        break;
    }
    return SessionStateId::Finished;
}

SessionStateId SessionController::platformSelect() {
    invalidateResults();
    platform_.clear();

    std::vector<std::string> platforms;
    std::string err;
    listPlatforms(*client_, config_.remoteRoot, platforms, err, &bus_);
    if (platforms.empty())
        return fatal("No platforms found on SFTP");

    MenuModel menu("Select Platform", platforms, config_.visibleRows);
    MenuBehavior behavior;
    behavior.allowBack = true;
    const MenuResult r = runMenu(menu, behavior);
    switch (r.action) {
    case MenuAction::Quit:
        return SessionStateId::Finished;
    case MenuAction::Back:
        return SessionStateId::ConfirmExit;
    case MenuAction::StartBatch:
        return SessionStateId::PlatformSelect;
    case MenuAction::Chosen:
        break;
    }
    platform_ = platforms[r.index];
    return SessionStateId::QueryInput;
}

SessionStateId SessionController::confirmExit() {
    MenuModel menu("Are you sure you want to exit the Downloader?",
                   {"No", "Yes"}, config_.visibleRows);
    const MenuResult r = runMenu(menu, MenuBehavior{});
    if (r.action == MenuAction::Quit ||
        (r.action == MenuAction::Chosen && r.index == 1))
        return SessionStateId::Finished;
    return SessionStateId::PlatformSelect;
}

SessionStateId SessionController::queryInput() {
    std::string query;
    if (!frontend_.promptText("Search in " + platform_ + " (ENTER to confirm)",
                              query)) {
        platform_.clear();
        return SessionStateId::PlatformSelect;
    }

    invalidateResults();
    const std::string baseDir = joinRemotePath(config_.remoteRoot, platform_);
    const std::vector<std::string> paths =
        searchRemote(*client_, baseDir, query, config_.searchLimit, &bus_);
    ++searches_;

    if (paths.empty()) {
        bus_.info("No results found.");
        MenuModel menu("No results. What next?",
                       {"New Search", "Change Platform", "Exit"},
                       config_.visibleRows);
        const MenuResult r = runMenu(menu, MenuBehavior{});
        if (r.action != MenuAction::Chosen || r.index == 2)
            return SessionStateId::Finished;
        if (r.index == 1) {
            platform_.clear();
            return SessionStateId::PlatformSelect;
        }
        return SessionStateId::QueryInput;
    }

    if (paths.size() >= config_.searchLimit)
        bus_.info("Showing the first " + std::to_string(config_.searchLimit) +
                  " matches");
    results_ = ResultSet::fromPaths(platform_, query, baseDir,
                                    config_.searchLimit, paths);
    return SessionStateId::ResultsList;
}

SessionStateId SessionController::resultsList() {
    std::vector<std::string> options;
    options.reserve(results_->items.size() + 1);
    for (const auto &item : results_->items)
        options.push_back(item.label);
    options.push_back(kBackLabel);

    MenuModel menu("Results", options, config_.visibleRows);
    MenuBehavior behavior;
    behavior.allowBack = true;
    behavior.multiControls = true;
    behavior.backIndex = results_->items.size();

    const MenuResult r = runMenu(menu, behavior);
    switch (r.action) {
    case MenuAction::Quit:
        return SessionStateId::Finished;
    case MenuAction::Back:
        invalidateResults();
        return SessionStateId::QueryInput;
    case MenuAction::StartBatch:
        return SessionStateId::BatchRunning;
    case MenuAction::Chosen:
        break;
    }
    if (r.index >= results_->items.size()) {
        invalidateResults();
        return SessionStateId::QueryInput;
    }
    pendingItem_ = r.index;
    return SessionStateId::ConfirmSingle;
}

SessionStateId SessionController::confirmSingle() {
    const ResultItem &item = results_->items[pendingItem_];
    MenuModel menu("Download '" + item.label + "'?", {"No", "Yes"},
                   config_.visibleRows);
    const MenuResult r = runMenu(menu, MenuBehavior{});
    if (r.action == MenuAction::Quit)
        return SessionStateId::Finished;
    if (r.action == MenuAction::Chosen && r.index == 1) {
        const BatchTask task{
            item.label, item.remotePath,
            localPathFor(config_.destRoot, results_->platform, item.label)};
        runTransfer(task, 0, 0);
        cancel_.reset();
        if (quitRequested_)
            return SessionStateId::Finished;
    }
    return SessionStateId::PostAction;
}

SessionStateId SessionController::batchRunning() {
    const std::vector<BatchTask> tasks =
        buildBatch(*results_, selection_, config_.destRoot);
    const BatchSummary summary = runBatch(
        tasks, cancel_,
        [this](const BatchTask &task, std::size_t index, std::size_t total) {
            return runTransfer(task, index, total);
        },
        selection_);
    bus_.info("Multi Select OFF: selections cleared");
    if (!summary.cancelled && summary.failed > 0)
        bus_.info(std::to_string(summary.succeeded) + " of " +
                  std::to_string(summary.total) + " files downloaded");
    if (quitRequested_)
        return SessionStateId::Finished;
    return SessionStateId::PostAction;
}

SessionStateId SessionController::postAction() {
    MenuModel menu("What next?",
                   {"Choose Another File", "New Search", "Change Platform",
                    "Exit"},
                   config_.visibleRows);
    const MenuResult r = runMenu(menu, MenuBehavior{});
    if (r.action != MenuAction::Chosen)
        return SessionStateId::Finished;
    switch (r.index) {
    case 0:
        return SessionStateId::ResultsList;
    case 1:
        invalidateResults();
        return SessionStateId::QueryInput;
    case 2:
        invalidateResults();
        platform_.clear();
        return SessionStateId::PlatformSelect;
    default:
        return SessionStateId::Finished;
    }
}

SessionStateId SessionController::fatal(const std::string &message) {
    bus_.error(message);
    logMessage(LogLevel::Critical, message);
    exitCode_ = 1;
    renderMessage("Exiting...");
    return SessionStateId::Finished;
}

SessionController::MenuResult
SessionController::runMenu(MenuModel &menu, const MenuBehavior &behavior) {
    while (true) {
        bus_.prune();
        renderMenu(menu, behavior);

        NavCommand cmd;
        if (!frontend_.nextCommand(config_.tick, cmd))
            continue;

        switch (cmd) {
        case NavCommand::MoveUp:
            menu.moveUp();
            break;
        case NavCommand::MoveDown:
            menu.moveDown();
            break;
        case NavCommand::MoveLeft:
            menu.pageUp();
            break;
        case NavCommand::MoveRight:
            menu.pageDown();
            break;
        case NavCommand::Confirm: {
            if (menu.empty())
                break;
            const bool multi =
                behavior.multiControls && selection_.multiSelect;
            if (!multi)
                return MenuResult{MenuAction::Chosen, menu.selected()};
            if (behavior.backIndex && menu.selected() == *behavior.backIndex)
                return MenuResult{MenuAction::Back, menu.selected()};
            const std::string &label = menu.current();
            if (selection_.toggle(label))
                bus_.info("Selected: " + label);
            else
                bus_.info("Unselected: " + label);
            break;
        }
        case NavCommand::Back:
            if (behavior.allowBack)
                return MenuResult{MenuAction::Back, menu.selected()};
            break;
        case NavCommand::ToggleMultiSelect:
            if (behavior.multiControls)
                toggleMultiSelect();
            break;
        case NavCommand::StartBatch:
            if (!behavior.multiControls || !selection_.multiSelect)
                break;
            if (selection_.labels.empty()) {
                bus_.info("No entries selected");
                break;
            }
            return MenuResult{MenuAction::StartBatch, menu.selected()};
        case NavCommand::Quit:
            return MenuResult{MenuAction::Quit, menu.selected()};
        }
    }
}

void SessionController::toggleMultiSelect() {
    selection_.multiSelect = !selection_.multiSelect;
    if (selection_.multiSelect) {
        bus_.info("Multi Select ON: choose entries, then start the download");
        return;
    }
    if (selection_.labels.empty()) {
        bus_.info("Multi Select OFF");
        return;
    }
    selection_.labels.clear();
    bus_.info("Multi Select OFF: selections cleared");
}

TransferState SessionController::runTransfer(const BatchTask &task,
                                             std::size_t index,
                                             std::size_t total) {
    progress_.reset();
    SftpClient &client = *client_;
    TransferWorker worker;
    const bool started = worker.start([this, &client, task]() {
        return downloadFile(client, task.remotePath, task.localPath, progress_,
                            cancel_, bus_, config_.download);
    });
    if (!started) {
        bus_.error("Failed to start download: " + task.label);
        return TransferState::Failed;
    }
    // Stops the job if the front-end throws, so the worker join is short.
    struct CancelOnUnwind {
        CancelToken &token;
        bool armed;
        ~CancelOnUnwind() {
            if (armed)
                token.request();
        }
    } unwind{cancel_, true};

    while (!worker.waitFor(config_.tick)) {
        bus_.prune();
        renderProgress(task, index, total);
        NavCommand cmd;
        while (frontend_.nextCommand(std::chrono::milliseconds(0), cmd)) {
            if (cmd == NavCommand::Back) {
                cancel_.request();
            } else if (cmd == NavCommand::Quit) {
                cancel_.request();
                quitRequested_ = true;
            }
        }
    }
    unwind.armed = false;
    const TransferState st = worker.result();
    logMessage(LogLevel::Info, std::string("Transfer ") +
                                   transferStateName(st) + ": " +
                                   task.remotePath);
    return st;
}

void SessionController::recordState(SessionStateId st) {
    if (history_.size() >= kHistoryLimit)
        history_.erase(history_.begin());
    history_.push_back(st);
}

void SessionController::invalidateResults() {
    results_.reset();
    selection_.reset();
}

std::string SessionController::menuFooter(const MenuBehavior &behavior) const {
    std::string footer = "Up/Down = Navigate | Confirm = Select";
    if (behavior.allowBack)
        footer += " | Back = Back";
    if (behavior.multiControls) {
        footer += " | Toggle = Multi-Select | Start = Download Selected";
        if (selection_.multiSelect)
            footer += " | Multi: ON (" +
                      std::to_string(selection_.labels.size()) + " selected)";
        else
            footer += " | Multi: OFF";
    }
    return footer;
}

void SessionController::renderMenu(const MenuModel &menu,
                                   const MenuBehavior &behavior) {
    ScreenModel screen;
    screen.kind = ScreenModel::Kind::Menu;
    screen.menu.title = menu.title();
    screen.menu.options = menu.options();
    screen.menu.selected = menu.selected();
    screen.menu.scrollOffset = menu.scrollOffset();
    screen.menu.visibleRows = menu.visibleRows();
    screen.menu.marked.assign(menu.options().size(), false);
    if (behavior.multiControls && selection_.multiSelect) {
        for (std::size_t i = 0; i < menu.options().size(); ++i) {
            if (behavior.backIndex && i == *behavior.backIndex)
                continue;
            screen.menu.marked[i] = selection_.contains(menu.options()[i]);
        }
    }
    screen.footer = menuFooter(behavior);
    screen.notifications = bus_.snapshot();
    frontend_.render(screen);
}

void SessionController::renderProgress(const BatchTask &task,
                                       std::size_t index, std::size_t total) {
    ScreenModel screen;
    screen.kind = ScreenModel::Kind::Progress;
    screen.progress.label = baseName(task.label);
    screen.progress.index = index;
    screen.progress.total = total;
    screen.progress.bytesRead = progress_.bytesRead.load();
    screen.progress.totalBytes = progress_.totalBytes.load();
    screen.progress.fraction = progress_.fraction();
    screen.progress.speed = progress_.speed.load();
    screen.progress.eta = progress_.eta.load();
    screen.footer = "Press Back to cancel download";
    screen.notifications = bus_.snapshot();
    frontend_.render(screen);
}

void SessionController::renderMessage(const std::string &footer) {
    ScreenModel screen;
    screen.kind = ScreenModel::Kind::Message;
    screen.footer = footer;
    screen.notifications = bus_.snapshot();
    frontend_.render(screen);
}

} // namespace romfetch
