#ifndef CONSOLEPROGRESSVIEW_H
#define CONSOLEPROGRESSVIEW_H

#include <QElapsedTimer>
#include <QHash>
#include <QObject>
#include <QTextStream>

#include "models/progressevent.h"

class ProgressReporter;

/**
 * @brief Renders progress events as text lines on a terminal.
 *
 * Drains the ProgressReporter whenever it announces new events. Byte
 * progress is shown on a single rewritten line with an estimate of the
 * remaining time; every settled unit gets its own line, and a summary
 * line is printed when a batch finishes.
 */
class ConsoleProgressView : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a view writing to @p output (stdout if null).
     */
    explicit ConsoleProgressView(ProgressReporter *reporter,
                                 FILE *output = nullptr,
                                 QObject *parent = nullptr);

    /**
     * @brief Formats one event the way it is printed.
     */
    [[nodiscard]] QString describe(const ProgressEvent &event);

signals:
    /**
     * @brief Emitted after the BatchFinished event of a batch is printed.
     */
    void batchRendered(int batchId, BatchStatus status);

public slots:
    /**
     * @brief Prints every queued event.
     */
    void drain();

private:

    void render(const ProgressEvent &event);
    [[nodiscard]] QString describeBytes(const ProgressEvent &event);
    [[nodiscard]] static QString counter(const ProgressEvent &event);

    ProgressReporter *reporter_;
    QTextStream out_;
    QHash<QString, QElapsedTimer> timers_;  // Keyed by "batch/unit"
    bool progressLineOpen_ = false;
};

#endif // CONSOLEPROGRESSVIEW_H
