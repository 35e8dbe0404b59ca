/**
 * @file transfersettings.h
 * @brief Settings the transfer engine reads, persisted with QSettings.
 */

#ifndef TRANSFERSETTINGS_H
#define TRANSFERSETTINGS_H

#include <QString>

#include "retrypolicy.h"

class QSettings;

/**
 * @brief Engine settings.
 *
 * confirmOperations is read by the front end before it submits a batch;
 * the engine itself never consults it. Everything else shapes how
 * batches are planned, executed and reported.
 */
struct TransferSettings {
    bool autoRefresh = true;
    bool confirmOperations = true;
    QString defaultDownloadPath;
    int workerCount = 3;
    int maxAttempts = 3;
    int initialBackoffMs = 500;
    int maxBackoffMs = 4000;
    int unitTimeoutMs = 300000;  // 5 minutes
    int progressIntervalMs = 250;
    int chunkSize = 8192;
    QString logLevel = QStringLiteral("INFO");

    static constexpr int MinWorkers = 1;
    static constexpr int MaxWorkers = 8;

    /**
     * @brief Returns the defaults, with the download path set to the
     *        user's Downloads location.
     */
    [[nodiscard]] static TransferSettings defaults();

    /**
     * @brief Reads settings from the "transfers" group, falling back to
     *        defaults for missing keys. The result is normalized.
     */
    [[nodiscard]] static TransferSettings load(QSettings &settings);

    /**
     * @brief Writes all values to the "transfers" group.
     */
    void save(QSettings &settings) const;

    /**
     * @brief Removes the stored "transfers" group so defaults apply again.
     */
    static void resetToDefaults(QSettings &settings);

    /**
     * @brief Returns a copy with every value clamped to a usable range.
     */
    [[nodiscard]] TransferSettings normalized() const;

    [[nodiscard]] RetryPolicy retryPolicy() const;

    /// True when logLevel asks for debug output
    [[nodiscard]] bool isVerbose() const;
};

#endif // TRANSFERSETTINGS_H
