// Qt logging categories and the bridge from the core log sink.
#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(rfCore)
Q_DECLARE_LOGGING_CATEGORY(rfUi)
Q_DECLARE_LOGGING_CATEGORY(rfTransfer)

namespace romfetchui {

// Installs the message pattern (timestamp, backtrace on critical) and routes
// romfetch::logMessage into the romfetch.core category.
void installLogging();

} // namespace romfetchui
