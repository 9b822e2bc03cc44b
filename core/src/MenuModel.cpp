#include "romfetch/MenuModel.hpp"

#include <algorithm>

namespace romfetch {

MenuModel::MenuModel(std::string title, std::vector<std::string> options,
                     std::size_t visibleRows)
    : title_(std::move(title)), options_(std::move(options)),
      rows_(std::max<std::size_t>(visibleRows, 1)) {}

void MenuModel::moveUp() {
    if (options_.empty())
        return;
    selected_ = selected_ == 0 ? options_.size() - 1 : selected_ - 1;
    follow();
}

void MenuModel::moveDown() {
    if (options_.empty())
        return;
    selected_ = (selected_ + 1) % options_.size();
    follow();
}

void MenuModel::pageUp() {
    if (options_.empty())
        return;
    selected_ = selected_ > rows_ ? selected_ - rows_ : 0;
    follow();
}

void MenuModel::pageDown() {
    if (options_.empty())
        return;
    selected_ = std::min(selected_ + rows_, options_.size() - 1);
    follow();
}

void MenuModel::select(std::size_t index) {
    if (options_.empty())
        return;
    selected_ = std::min(index, options_.size() - 1);
    follow();
}

const std::string &MenuModel::current() const {
    static const std::string none;
    return options_.empty() ? none : options_[selected_];
}

void MenuModel::follow() {
    if (selected_ < scroll_)
        scroll_ = selected_;
    else if (selected_ >= scroll_ + rows_)
        scroll_ = selected_ - rows_ + 1;
}

} // namespace romfetch
