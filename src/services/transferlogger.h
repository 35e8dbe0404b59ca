/**
 * @file transferlogger.h
 * @brief Structured log records for transfer attempts and outcomes.
 */

#ifndef TRANSFERLOGGER_H
#define TRANSFERLOGGER_H

#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QMutex>
#include <QObject>
#include <QString>

/**
 * @brief A single structured log record.
 */
struct LogRecord {
    enum class Level { Debug, Info, Warning, Error };

    QDateTime timestamp;
    int batchId = -1;
    QString unitId;   ///< Empty for batch-level records
    Level level = Level::Info;
    QString message;
};

Q_DECLARE_METATYPE(LogRecord)

/**
 * @brief Collects transfer log records from any thread.
 *
 * Each record is forwarded to the Qt message handler at its level
 * (debug records only in verbose mode), appended to a bounded in-memory
 * history, and announced through recordLogged(). Workers call log()
 * directly; the signal is delivered to receivers on their own threads.
 *
 * @par Example usage:
 * @code
 * TransferLogger *logger = new TransferLogger(this);
 * connect(logger, &TransferLogger::recordLogged,
 *         logView, &LogView::appendRecord);
 *
 * logger->log(LogRecord::Level::Info, batchId, unit.unitId(batchId),
 *             "attempt 1: started");
 * @endcode
 */
class TransferLogger : public QObject
{
    Q_OBJECT

public:
    explicit TransferLogger(QObject *parent = nullptr);
    ~TransferLogger() override = default;

    /**
     * @brief Records a message.
     * @param level Severity.
     * @param batchId Batch the message refers to.
     * @param unitId Unit identity, or empty for batch-level messages.
     * @param message Human-readable text.
     */
    void log(LogRecord::Level level, int batchId, const QString &unitId, const QString &message);

    /**
     * @brief Returns the retained history, oldest first.
     */
    [[nodiscard]] QList<LogRecord> records() const;

    /**
     * @brief Returns retained records for one unit.
     */
    [[nodiscard]] QList<LogRecord> recordsForUnit(const QString &unitId) const;

    /**
     * @brief Sets how many records are kept in memory.
     */
    void setHistoryLimit(int limit);

    void clear();

    [[nodiscard]] static QString levelToString(LogRecord::Level level);

signals:
    /**
     * @brief Emitted after each record is logged.
     * @param record The new record.
     */
    void recordLogged(const LogRecord &record);

private:
    mutable QMutex mutex_;
    QList<LogRecord> history_;
    int historyLimit_ = 5000;
};

#endif // TRANSFERLOGGER_H
