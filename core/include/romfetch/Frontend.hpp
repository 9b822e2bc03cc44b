// Boundary between the session engine and the presentation layer. The
// front-end draws ScreenModel snapshots and turns device input into
// debounced navigation commands.
#pragma once
#include "NotificationBus.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace romfetch {

enum class NavCommand {
    MoveUp,
    MoveDown,
    MoveLeft,
    MoveRight,
    Confirm,
    Back,
    ToggleMultiSelect,
    StartBatch,
    Quit
};

const char *navCommandName(NavCommand cmd);

struct MenuView {
    std::string title;
    std::vector<std::string> options;
    std::vector<bool> marked; // per option, multi-select checkmark
    std::size_t selected = 0;
    std::size_t scrollOffset = 0;
    std::size_t visibleRows = 0;
};

struct ProgressView {
    std::string label;
    std::size_t index = 0; // 1-based within a batch, 0 for a single file
    std::size_t total = 0;
    std::uint64_t bytesRead = 0;
    std::uint64_t totalBytes = 0;
    double fraction = 0.0;
    double speed = 0.0; // bytes per second
    double eta = 0.0;   // seconds
};

struct ScreenModel {
    enum class Kind { Menu, Progress, Message };

    Kind kind = Kind::Menu;
    MenuView menu;
    ProgressView progress;
    std::string footer;
    std::vector<NotificationView> notifications;
};

class Frontend {
public:
    virtual ~Frontend() = default;

    virtual void render(const ScreenModel &screen) = 0;

    // Waits up to `timeout` for the next command. Returns false on timeout.
    // A zero timeout polls without blocking.
    virtual bool nextCommand(std::chrono::milliseconds timeout,
                             NavCommand &cmd) = 0;

    // Text entry (virtual keyboard). Returns false when the user backs out.
    virtual bool promptText(const std::string &prompt, std::string &out) = 0;
};

} // namespace romfetch
