#include "transferlogger.h"
#include "utils/logging.h"

#include <QMutexLocker>

TransferLogger::TransferLogger(QObject *parent)
    : QObject(parent)
{
    qRegisterMetaType<LogRecord>("LogRecord");
}

void TransferLogger::log(LogRecord::Level level, int batchId, const QString &unitId, const QString &message)
{
    LogRecord record;
    record.timestamp = QDateTime::currentDateTimeUtc();
    record.batchId = batchId;
    record.unitId = unitId;
    record.level = level;
    record.message = message;

    QString line = unitId.isEmpty()
        ? QString("Transfer [batch %1] %2").arg(batchId).arg(message)
        : QString("Transfer [unit %1] %2").arg(unitId, message);

    switch (level) {
    case LogRecord::Level::Debug:
        LOG_VERBOSE().noquote() << line;
        break;
    case LogRecord::Level::Info:
        qInfo().noquote() << line;
        break;
    case LogRecord::Level::Warning:
        qWarning().noquote() << line;
        break;
    case LogRecord::Level::Error:
        qCritical().noquote() << line;
        break;
    }

    {
        QMutexLocker locker(&mutex_);
        history_.append(record);
        while (history_.size() > historyLimit_) {
            history_.removeFirst();
        }
    }

    emit recordLogged(record);
}

QList<LogRecord> TransferLogger::records() const
{
    QMutexLocker locker(&mutex_);
    return history_;
}

QList<LogRecord> TransferLogger::recordsForUnit(const QString &unitId) const
{
    QMutexLocker locker(&mutex_);
    QList<LogRecord> result;
    for (const LogRecord &record : history_) {
        if (record.unitId == unitId) {
            result.append(record);
        }
    }
    return result;
}

void TransferLogger::setHistoryLimit(int limit)
{
    QMutexLocker locker(&mutex_);
    historyLimit_ = qMax(1, limit);
    while (history_.size() > historyLimit_) {
        history_.removeFirst();
    }
}

void TransferLogger::clear()
{
    QMutexLocker locker(&mutex_);
    history_.clear();
}

QString TransferLogger::levelToString(LogRecord::Level level)
{
    switch (level) {
    case LogRecord::Level::Debug:
        return QStringLiteral("DEBUG");
    case LogRecord::Level::Info:
        return QStringLiteral("INFO");
    case LogRecord::Level::Warning:
        return QStringLiteral("WARN");
    case LogRecord::Level::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("UNKNOWN");
}
