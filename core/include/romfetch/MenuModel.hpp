// Cursor and scroll window over a vertical list of options.
#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace romfetch {

class MenuModel {
public:
    MenuModel(std::string title, std::vector<std::string> options,
              std::size_t visibleRows);

    // Up/down wrap around the ends.
    void moveUp();
    void moveDown();
    // Left/right jump a page and stop at the ends.
    void pageUp();
    void pageDown();
    void select(std::size_t index);

    const std::string &title() const { return title_; }
    const std::vector<std::string> &options() const { return options_; }
    std::size_t selected() const { return selected_; }
    std::size_t scrollOffset() const { return scroll_; }
    std::size_t visibleRows() const { return rows_; }
    bool empty() const { return options_.empty(); }
    const std::string &current() const;

private:
    void follow();

    std::string title_;
    std::vector<std::string> options_;
    std::size_t rows_;
    std::size_t selected_ = 0;
    std::size_t scroll_ = 0;
};

} // namespace romfetch
