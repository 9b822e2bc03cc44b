#include "romfetch/NotificationBus.hpp"
#include "romfetch/RuntimeLogging.hpp"

#include <algorithm>

namespace romfetch {

namespace {
constexpr auto kFadeWindow = std::chrono::seconds(2);
}

const char *notificationKindName(NotificationKind kind) {
    switch (kind) {
    case NotificationKind::Error:
        return "ERROR";
    case NotificationKind::Info:
        return "INFO";
    case NotificationKind::Success:
        return "OK";
    }
    return "INFO";
}

int Notification::alpha(Clock::time_point now) const {
    const auto elapsed = now - createdAt;
    if (elapsed > lifetime)
        return 0;
    const Clock::duration fade =
        std::min<Clock::duration>(kFadeWindow, lifetime);
    const auto remaining = lifetime - elapsed;
    if (fade.count() <= 0 || remaining >= fade)
        return 255;
    const double ratio = std::chrono::duration<double>(remaining).count() /
                         std::chrono::duration<double>(fade).count();
    return std::max(0, std::min(255, static_cast<int>(255.0 * ratio)));
}

NotificationBus::NotificationBus(Clock::duration lifetime, NowFn now)
    : lifetime_(lifetime), now_(std::move(now)) {}

void NotificationBus::publish(const std::string &message,
                              NotificationKind kind) {
    Notification n;
    n.message = message;
    n.kind = kind;
    n.createdAt = now();
    n.lifetime = lifetime_;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        items_.push_back(std::move(n));
    }
    logMessage(kind == NotificationKind::Error ? LogLevel::Warning
                                               : LogLevel::Info,
               std::string("[") + notificationKindName(kind) + "] " + message);
}

std::size_t NotificationBus::prune() {
    const auto t = now();
    std::lock_guard<std::mutex> lk(mtx_);
    const auto before = items_.size();
    items_.erase(std::remove_if(items_.begin(), items_.end(),
                                [t](const Notification &n) {
                                    return n.expired(t);
                                }),
                 items_.end());
    return before - items_.size();
}

std::vector<NotificationView> NotificationBus::snapshot() const {
    const auto t = now();
    std::vector<NotificationView> out;
    std::lock_guard<std::mutex> lk(mtx_);
    out.reserve(items_.size());
    for (const auto &n : items_) {
        if (n.expired(t))
            continue;
        out.push_back(NotificationView{n.message, n.kind, n.alpha(t)});
    }
    return out;
}

std::size_t NotificationBus::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return items_.size();
}

void NotificationBus::clear() {
    std::lock_guard<std::mutex> lk(mtx_);
    items_.clear();
}

} // namespace romfetch
