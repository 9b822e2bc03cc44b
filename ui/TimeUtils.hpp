// Small formatting helpers for the progress screen.
#pragma once
#include <QString>

namespace romfetchui {

// "42s", "3m 5s", "2h 10m", "1d 4h".
inline QString formatEta(double seconds) {
    qint64 s = seconds > 0 ? static_cast<qint64>(seconds) : 0;
    if (s < 60)
        return QStringLiteral("%1s").arg(s);
    qint64 minutes = s / 60;
    s %= 60;
    if (minutes < 60)
        return QStringLiteral("%1m %2s").arg(minutes).arg(s);
    qint64 hours = minutes / 60;
    minutes %= 60;
    if (hours < 24)
        return QStringLiteral("%1h %2m").arg(hours).arg(minutes);
    return QStringLiteral("%1d %2h").arg(hours / 24).arg(hours % 24);
}

// Bytes per second as MB/s with two decimals.
inline QString formatSpeed(double bytesPerSecond) {
    const double mb = bytesPerSecond / (1024.0 * 1024.0);
    return QStringLiteral("%1 MB/s").arg(mb, 0, 'f', 2);
}

inline QString formatBytes(quint64 bytes) {
    static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double v = static_cast<double>(bytes);
    int u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        ++u;
    }
    return u == 0 ? QStringLiteral("%1 B").arg(bytes)
                  : QStringLiteral("%1 %2").arg(v, 0, 'f', 1).arg(units[u]);
}

} // namespace romfetchui
