#include "transfersettings.h"

#include <QDebug>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <algorithm>

TransferSettings TransferSettings::defaults()
{
    TransferSettings settings;
    QString downloads = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (downloads.isEmpty()) {
        downloads = QDir::home().filePath("Downloads");
    }
    settings.defaultDownloadPath = downloads;
    return settings;
}

TransferSettings TransferSettings::load(QSettings &settings)
{
    const TransferSettings d = defaults();
    TransferSettings result;

    result.autoRefresh = settings.value("transfers/autoRefresh", d.autoRefresh).toBool();
    result.confirmOperations = settings.value("transfers/confirmOperations", d.confirmOperations).toBool();
    result.defaultDownloadPath = settings.value("transfers/defaultDownloadPath", d.defaultDownloadPath).toString();
    result.workerCount = settings.value("transfers/workerCount", d.workerCount).toInt();
    result.maxAttempts = settings.value("transfers/maxAttempts", d.maxAttempts).toInt();
    result.initialBackoffMs = settings.value("transfers/initialBackoffMs", d.initialBackoffMs).toInt();
    result.maxBackoffMs = settings.value("transfers/maxBackoffMs", d.maxBackoffMs).toInt();
    result.unitTimeoutMs = settings.value("transfers/unitTimeoutMs", d.unitTimeoutMs).toInt();
    result.progressIntervalMs = settings.value("transfers/progressIntervalMs", d.progressIntervalMs).toInt();
    result.chunkSize = settings.value("transfers/chunkSize", d.chunkSize).toInt();
    result.logLevel = settings.value("transfers/logLevel", d.logLevel).toString();

    return result.normalized();
}

void TransferSettings::save(QSettings &settings) const
{
    settings.setValue("transfers/autoRefresh", autoRefresh);
    settings.setValue("transfers/confirmOperations", confirmOperations);
    settings.setValue("transfers/defaultDownloadPath", defaultDownloadPath);
    settings.setValue("transfers/workerCount", workerCount);
    settings.setValue("transfers/maxAttempts", maxAttempts);
    settings.setValue("transfers/initialBackoffMs", initialBackoffMs);
    settings.setValue("transfers/maxBackoffMs", maxBackoffMs);
    settings.setValue("transfers/unitTimeoutMs", unitTimeoutMs);
    settings.setValue("transfers/progressIntervalMs", progressIntervalMs);
    settings.setValue("transfers/chunkSize", chunkSize);
    settings.setValue("transfers/logLevel", logLevel);
}

void TransferSettings::resetToDefaults(QSettings &settings)
{
    settings.remove("transfers");
    qDebug() << "TransferSettings: Reset to defaults";
}

TransferSettings TransferSettings::normalized() const
{
    TransferSettings result = *this;

    result.workerCount = std::clamp(workerCount, MinWorkers, MaxWorkers);
    result.maxAttempts = std::clamp(maxAttempts, 1, 10);
    result.initialBackoffMs = std::max(initialBackoffMs, 0);
    result.maxBackoffMs = std::max(maxBackoffMs, result.initialBackoffMs);
    result.unitTimeoutMs = unitTimeoutMs > 0 ? unitTimeoutMs : 300000;
    result.progressIntervalMs = std::max(progressIntervalMs, 0);
    result.chunkSize = std::clamp(chunkSize, 512, 16 * 1024 * 1024);
    result.logLevel = logLevel.trimmed().toUpper();
    if (result.logLevel.isEmpty()) {
        result.logLevel = QStringLiteral("INFO");
    }
    if (result.defaultDownloadPath.isEmpty()) {
        result.defaultDownloadPath = defaults().defaultDownloadPath;
    }

    return result;
}

RetryPolicy TransferSettings::retryPolicy() const
{
    RetryPolicy policy;
    policy.maxAttempts = maxAttempts;
    policy.initialBackoffMs = initialBackoffMs;
    policy.maxBackoffMs = maxBackoffMs;
    return policy;
}

bool TransferSettings::isVerbose() const
{
    return logLevel.compare(QLatin1String("DEBUG"), Qt::CaseInsensitive) == 0;
}
