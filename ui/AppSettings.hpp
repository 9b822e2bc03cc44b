// Startup configuration: QSettings values with environment overrides.
#pragma once
#include "romfetch/SessionController.hpp"
#include "romfetch/SftpTypes.hpp"

#include <QString>
#include <chrono>

namespace romfetchui {

struct AppSettings {
    romfetch::SessionOptions session;
    romfetch::SessionConfig config;
    std::chrono::seconds notificationLifetime{4};
};

// Reads QSettings("RomFetch", "RomFetch"); SFTP_CONNECTION_STRING and
// DEST_DIR take precedence over the stored values. Returns false when no
// usable connection string is available.
bool loadAppSettings(AppSettings &out, QString &err);

} // namespace romfetchui
