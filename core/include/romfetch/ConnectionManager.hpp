// Owns the single authenticated session to the remote service.
#pragma once
#include "SftpClient.hpp"
#include <functional>
#include <memory>
#include <string>

namespace romfetch {

class NotificationBus;

class ConnectionManager {
public:
    using ClientFactory = std::function<std::unique_ptr<SftpClient>()>;

    ConnectionManager(ClientFactory factory, NotificationBus &bus);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager &) = delete;
    ConnectionManager &operator=(const ConnectionManager &) = delete;

    // Opens a new session, closing any previous one. Returns nullptr with
    // `err` set when the host is unreachable, authentication is rejected or
    // negotiation fails; the failure is also published on the bus.
    SftpClient *open(const SessionOptions &opt, std::string &err);

    // Releases the session. Safe to call repeatedly; never propagates.
    void close() noexcept;

    SftpClient *session() const { return client_.get(); }

private:
    ClientFactory factory_;
    NotificationBus &bus_;
    std::unique_ptr<SftpClient> client_;
};

} // namespace romfetch
