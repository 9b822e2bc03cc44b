#include "romfetch/ConnectionManager.hpp"
#include "romfetch/ConnectionUri.hpp"
#include "romfetch/NotificationBus.hpp"
#include "romfetch/RuntimeLogging.hpp"

#include <exception>

namespace romfetch {

ConnectionManager::ConnectionManager(ClientFactory factory,
                                     NotificationBus &bus)
    : factory_(std::move(factory)), bus_(bus) {}

ConnectionManager::~ConnectionManager() { close(); }

SftpClient *ConnectionManager::open(const SessionOptions &opt,
                                    std::string &err) {
    close();
    std::unique_ptr<SftpClient> client = factory_ ? factory_() : nullptr;
    if (!client) {
        err = "No SFTP backend available";
        bus_.error("SFTP connection failed: " + err);
        return nullptr;
    }
    logMessage(LogLevel::Info, "Connecting to " + describeConnection(opt));
    if (!client->connect(opt, err)) {
        if (err.empty())
            err = "unknown error";
        bus_.error("SFTP connection failed: " + err);
        logMessage(LogLevel::Critical, "SFTP connection failed for " +
                                           describeConnection(opt) + ": " +
                                           err);
        return nullptr;
    }
    client_ = std::move(client);
    return client_.get();
}

void ConnectionManager::close() noexcept {
    if (!client_)
        return;
    try {
        client_->disconnect();
    } catch (const std::exception &e) {
        logMessage(LogLevel::Warning,
                   std::string("Ignoring error while closing session: ") +
                       e.what());
    } catch (...) {
        logMessage(LogLevel::Warning,
                   "Ignoring unknown error while closing session");
    }
    client_.reset();
}

} // namespace romfetch
