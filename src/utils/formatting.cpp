#include "formatting.h"

#include <QStringList>

QString Formatting::formatFileSize(qint64 bytes)
{
    if (bytes <= 0) {
        return QStringLiteral("0 B");
    }

    static const QStringList units = {"B", "KB", "MB", "GB", "TB", "PB"};
    double size = static_cast<double>(bytes);

    for (const QString &unit : units) {
        if (size < 1024.0) {
            if (unit == QLatin1String("B")) {
                return QString("%1 %2").arg(static_cast<qint64>(size)).arg(unit);
            }
            return QString("%1 %2").arg(size, 0, 'f', 1).arg(unit);
        }
        size /= 1024.0;
    }

    // Anything past PB keeps the last unit
    return QString("%1 %2").arg(size * 1024.0, 0, 'f', 1).arg(units.last());
}

QString Formatting::estimateTransferTime(qint64 bytes, double bytesPerSecond)
{
    if (bytesPerSecond <= 0.0) {
        return QStringLiteral("Unknown");
    }

    const qint64 seconds = static_cast<qint64>(static_cast<double>(bytes) / bytesPerSecond);

    if (seconds < 60) {
        return QString("%1s").arg(seconds);
    }
    if (seconds < 3600) {
        return QString("%1m %2s").arg(seconds / 60).arg(seconds % 60);
    }
    return QString("%1h %2m").arg(seconds / 3600).arg((seconds % 3600) / 60);
}

QString Formatting::sanitizeFileName(const QString &name)
{
    static const QString invalidChars = QStringLiteral("<>:\"/\\|?*");
    static constexpr int MaxLength = 255;

    QString sanitized;
    sanitized.reserve(name.size());
    for (const QChar ch : name) {
        if (ch.unicode() < 0x20 || invalidChars.contains(ch)) {
            sanitized.append(QLatin1Char('_'));
        } else {
            sanitized.append(ch);
        }
    }

    // Strip leading/trailing dots and spaces
    int start = 0;
    int end = sanitized.size();
    auto isTrimmed = [](QChar c) { return c == QLatin1Char('.') || c == QLatin1Char(' '); };
    while (start < end && isTrimmed(sanitized.at(start))) {
        ++start;
    }
    while (end > start && isTrimmed(sanitized.at(end - 1))) {
        --end;
    }
    sanitized = sanitized.mid(start, end - start);

    if (sanitized.isEmpty()) {
        return QStringLiteral("untitled");
    }

    if (sanitized.size() > MaxLength) {
        const int dot = sanitized.lastIndexOf(QLatin1Char('.'));
        const QString extension = dot > 0 ? sanitized.mid(dot) : QString();
        if (extension.size() < MaxLength) {
            sanitized = sanitized.left(MaxLength - extension.size()) + extension;
        } else {
            sanitized = sanitized.left(MaxLength);
        }
    }

    return sanitized;
}
