#include "AppSettings.hpp"
#include "LogSetup.hpp"
#include "romfetch/ConnectionUri.hpp"

#include <QSettings>
#include <QtGlobal>

namespace romfetchui {

namespace {

QString envOrSetting(const char *envName, const QSettings &s,
                     const QString &key, const QString &fallback = {}) {
    const QString env = qEnvironmentVariable(envName).trimmed();
    if (!env.isEmpty())
        return env;
    return s.value(key, fallback).toString().trimmed();
}

romfetch::KnownHostsPolicy parsePolicy(const QString &raw) {
    const QString v = raw.trimmed().toLower();
    if (v == QLatin1String("strict"))
        return romfetch::KnownHostsPolicy::Strict;
    if (v == QLatin1String("acceptnew") || v == QLatin1String("accept-new"))
        return romfetch::KnownHostsPolicy::AcceptNew;
    if (!v.isEmpty() && v != QLatin1String("off"))
        qCWarning(rfUi) << "Unknown Security/knownHostsPolicy" << raw
                        << "- host keys are not checked";
    return romfetch::KnownHostsPolicy::Off;
}

} // namespace

bool loadAppSettings(AppSettings &out, QString &err) {
    QSettings s("RomFetch", "RomFetch");

    const QString uri = envOrSetting("SFTP_CONNECTION_STRING", s,
                                     QStringLiteral("Connection/uri"));
    if (uri.isEmpty()) {
        err = QStringLiteral("SFTP_CONNECTION_STRING is not set");
        return false;
    }
    std::string perr;
    if (!romfetch::parseConnectionUri(uri.toStdString(), out.session, perr)) {
        err = QStringLiteral("Invalid connection string: %1")
                  .arg(QString::fromStdString(perr));
        return false;
    }

    out.session.known_hosts_policy =
        parsePolicy(s.value("Security/knownHostsPolicy").toString());
    const QString khPath = s.value("Security/knownHostsPath").toString().trimmed();
    if (!khPath.isEmpty())
        out.session.known_hosts_path = khPath.toStdString();

    out.config.destRoot =
        envOrSetting("DEST_DIR", s, QStringLiteral("Transfer/destDir"),
                     QStringLiteral("./downloads"))
            .toStdString();
    if (out.config.destRoot.empty())
        out.config.destRoot = "./downloads";

    bool ok = false;
    const int blockKiB = s.value("Transfer/blockSizeKiB", 1024).toInt(&ok);
    if (ok && blockKiB > 0)
        out.config.download.blockSize = static_cast<std::size_t>(blockKiB) * 1024;
    else
        qCWarning(rfUi) << "Ignoring invalid Transfer/blockSizeKiB";

    const int limit = s.value("Search/limit", 2000).toInt(&ok);
    if (ok && limit >= 0)
        out.config.searchLimit = static_cast<std::size_t>(limit);
    else
        qCWarning(rfUi) << "Ignoring invalid Search/limit";

    const int lifetime = s.value("Notifications/lifetimeSec", 4).toInt(&ok);
    if (ok && lifetime > 0)
        out.notificationLifetime = std::chrono::seconds(lifetime);
    else
        qCWarning(rfUi) << "Ignoring invalid Notifications/lifetimeSec";

    qCInfo(rfUi).noquote()
        << "Remote:" << QString::fromStdString(romfetch::describeConnection(out.session))
        << "destination:" << QString::fromStdString(out.config.destRoot);
    return true;
}

} // namespace romfetchui
