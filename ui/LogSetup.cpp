#include "LogSetup.hpp"
#include "romfetch/RuntimeLogging.hpp"

#include <QString>

Q_LOGGING_CATEGORY(rfCore, "romfetch.core")
Q_LOGGING_CATEGORY(rfUi, "romfetch.ui")
Q_LOGGING_CATEGORY(rfTransfer, "romfetch.transfer")

namespace romfetchui {

void installLogging() {
    qSetMessagePattern(QStringLiteral(
        "%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{category}: %{message}"
        "%{if-critical}\n%{backtrace depth=16 separator=\"\n\"}%{endif}"
        "%{if-fatal}\n%{backtrace depth=16 separator=\"\n\"}%{endif}"));

    if (!romfetch::isDevEnvironment())
        QLoggingCategory::setFilterRules(QStringLiteral("romfetch.*.debug=false"));

    // Called from the transfer thread too; Qt's message handler is thread-safe.
    romfetch::setLogSink([](romfetch::LogLevel level, const std::string &msg) {
        const QString text = QString::fromStdString(msg);
        switch (level) {
        case romfetch::LogLevel::Debug:
            qCDebug(rfCore).noquote() << text;
            break;
        case romfetch::LogLevel::Info:
            qCInfo(rfCore).noquote() << text;
            break;
        case romfetch::LogLevel::Warning:
            qCWarning(rfCore).noquote() << text;
            break;
        case romfetch::LogLevel::Critical:
            qCCritical(rfCore).noquote() << text;
            break;
        }
    });
}

} // namespace romfetchui
