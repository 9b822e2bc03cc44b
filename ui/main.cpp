// Entry point: configuration, logging, the libssh2 backend and the kiosk
// window wired to the session controller.
#include "AppSettings.hpp"
#include "KioskWindow.hpp"
#include "LogSetup.hpp"
#include "UiAlerts.hpp"
#include "romfetch/ConnectionManager.hpp"
#include "romfetch/Libssh2SftpClient.hpp"
#include "romfetch/NotificationBus.hpp"
#include "romfetch/SessionController.hpp"

#include <QApplication>
#include <QStringList>
#include <exception>
#include <memory>

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("RomFetch"));
    QCoreApplication::setApplicationName(QStringLiteral("RomFetch"));
    romfetchui::installLogging();

    romfetchui::AppSettings settings;
    QString err;
    if (!romfetchui::loadAppSettings(settings, err)) {
        qCCritical(rfUi).noquote() << err;
        UiAlerts::critical(nullptr, QStringLiteral("RomFetch"), err);
        return 1;
    }

    romfetchui::KioskWindow window;
    settings.session.hostkey_confirm_cb =
        [&window](const std::string &host, std::uint16_t port,
                  const std::string &algorithm, const std::string &fingerprint) {
            return UiAlerts::confirm(
                &window, QStringLiteral("Unknown host"),
                QStringLiteral("%1:%2 is not in known_hosts.\n%3 %4\n\nTrust it?")
                    .arg(QString::fromStdString(host))
                    .arg(port)
                    .arg(QString::fromStdString(algorithm))
                    .arg(QString::fromStdString(fingerprint)));
        };

    romfetch::NotificationBus bus(settings.notificationLifetime);
    romfetch::ConnectionManager connections(
        [] { return std::make_unique<romfetch::Libssh2SftpClient>(); }, bus);
    romfetch::SessionController controller(connections, window, bus,
                                           settings.config);

    window.resize(1280, 720);
    if (qEnvironmentVariableIntValue("ROMFETCH_FULLSCREEN") != 0)
        window.showFullScreen();
    else
        window.show();

    int rc = 1;
    try {
        rc = controller.run(settings.session);
    } catch (const std::exception &e) {
        qCCritical(rfUi) << "Fatal error in main loop:" << e.what();
        connections.close();
        rc = 1;
    }

    if (rc != 0) {
        QStringList lines;
        for (const auto &n : bus.snapshot()) {
            if (n.kind == romfetch::NotificationKind::Error)
                lines << QString::fromStdString(n.message);
        }
        if (!lines.isEmpty())
            UiAlerts::critical(&window, QStringLiteral("RomFetch"),
                               lines.join(QLatin1Char('\n')));
    }
    qCInfo(rfUi) << "Exiting with status" << rc;
    return rc;
}
