// Thread-safe queue of short-lived status messages shown over the UI.
// Producers may run on the transfer worker; snapshot() and prune() run on the
// foreground loop.
#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace romfetch {

enum class NotificationKind { Error, Info, Success };

const char *notificationKindName(NotificationKind kind);

struct Notification {
    using Clock = std::chrono::steady_clock;

    std::string message;
    NotificationKind kind = NotificationKind::Info;
    Clock::time_point createdAt;
    Clock::duration lifetime;

    bool expired(Clock::time_point now) const {
        return (now - createdAt) > lifetime;
    }
    // 255 while fresh, fading linearly to 0 over the last two seconds.
    int alpha(Clock::time_point now) const;
};

// What the presentation layer needs for one visible notification.
struct NotificationView {
    std::string message;
    NotificationKind kind = NotificationKind::Info;
    int alpha = 255;
};

class NotificationBus {
public:
    using Clock = Notification::Clock;
    using NowFn = std::function<Clock::time_point()>;

    explicit NotificationBus(Clock::duration lifetime = std::chrono::seconds(4),
                             NowFn now = {});

    // Appends a notification and writes it to the diagnostic log.
    void publish(const std::string &message, NotificationKind kind);
    void error(const std::string &message) {
        publish(message, NotificationKind::Error);
    }
    void info(const std::string &message) {
        publish(message, NotificationKind::Info);
    }
    void success(const std::string &message) {
        publish(message, NotificationKind::Success);
    }

    // Removes expired entries. Returns how many were dropped.
    std::size_t prune();

    // Consistent copy of the live entries, oldest first.
    std::vector<NotificationView> snapshot() const;

    std::size_t size() const;
    void clear();

    Clock::duration lifetime() const { return lifetime_; }

private:
    Clock::time_point now() const { return now_ ? now_() : Clock::now(); }

    Clock::duration lifetime_;
    NowFn now_;
    mutable std::mutex mtx_; // protects items_
    std::vector<Notification> items_;
};

} // namespace romfetch
