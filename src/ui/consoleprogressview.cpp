#include "consoleprogressview.h"
#include "services/progressreporter.h"
#include "utils/formatting.h"

#include <cstdio>

ConsoleProgressView::ConsoleProgressView(ProgressReporter *reporter, FILE *output, QObject *parent)
    : QObject(parent)
    , reporter_(reporter)
    , out_(output ? output : stdout)
{
    connect(reporter_, &ProgressReporter::eventsAvailable,
            this, &ConsoleProgressView::drain, Qt::QueuedConnection);
}

void ConsoleProgressView::drain()
{
    const QList<ProgressEvent> events = reporter_->takeAll();
    for (const ProgressEvent &event : events) {
        render(event);
    }
    out_.flush();
}

void ConsoleProgressView::render(const ProgressEvent &event)
{
    const QString line = describe(event);

    if (event.type == ProgressEvent::Type::BytesProgress) {
        out_ << '\r' << line << "\x1b[K";
        progressLineOpen_ = true;
        return;
    }

    if (progressLineOpen_) {
        out_ << '\r' << "\x1b[K";
        progressLineOpen_ = false;
    }
    out_ << line << '\n';

    if (event.type == ProgressEvent::Type::BatchFinished && event.batchStatus.has_value()) {
        out_.flush();
        emit batchRendered(event.batchId, event.batchStatus.value());
    }
}

QString ConsoleProgressView::counter(const ProgressEvent &event)
{
    return QString("[%1/%2]").arg(event.unitIndex + 1).arg(event.totalUnits);
}

QString ConsoleProgressView::describe(const ProgressEvent &event)
{
    switch (event.type) {
    case ProgressEvent::Type::BytesProgress:
        return describeBytes(event);

    case ProgressEvent::Type::UnitFinished: {
        timers_.remove(QString("%1/%2").arg(event.batchId).arg(event.unitIndex));
        const UnitOutcome outcome = event.unitResult.value_or(UnitOutcome::Failed);
        QString line = QString("%1 %2 %3")
                           .arg(counter(event), QString(unitOutcomeToString(outcome)).leftJustified(9),
                                event.unitName);
        if (!event.errorMessage.isEmpty()) {
            line += QString(" (%1)").arg(event.errorMessage);
        }
        return line;
    }

    case ProgressEvent::Type::BatchFinished: {
        const BatchSummary &s = event.summary;
        QString line = QString("Batch %1 %2: %3 succeeded, %4 failed, %5 skipped, %6 cancelled")
                           .arg(event.batchId)
                           .arg(batchStatusToString(event.batchStatus.value_or(BatchStatus::Failed)))
                           .arg(s.succeeded)
                           .arg(s.failed)
                           .arg(s.skipped)
                           .arg(s.cancelled);
        if (s.planningErrors > 0) {
            line += QString(", %1 could not be planned").arg(s.planningErrors);
        }
        return line;
    }
    }

    return QString();
}

QString ConsoleProgressView::describeBytes(const ProgressEvent &event)
{
    const qint64 transferred = event.bytesTransferred.value_or(0);
    const qint64 total = event.bytesTotal.value_or(0);

    QElapsedTimer &timer = timers_[QString("%1/%2").arg(event.batchId).arg(event.unitIndex)];
    if (!timer.isValid()) {
        timer.start();
    }

    QString line = QString("%1 %2 %3").arg(counter(event), event.unitName, Formatting::formatFileSize(transferred));
    if (total > 0) {
        line += QString(" / %1").arg(Formatting::formatFileSize(total));

        const qint64 elapsedMs = timer.elapsed();
        if (elapsedMs > 0 && transferred > 0 && transferred < total) {
            const double bytesPerSecond = transferred * 1000.0 / elapsedMs;
            line += QString(" (%1 left)").arg(Formatting::estimateTransferTime(total - transferred, bytesPerSecond));
        }
    }
    return line;
}
