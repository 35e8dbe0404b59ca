/**
 * @file formatting.h
 * @brief Human-readable formatting helpers for sizes, durations and file names.
 */

#ifndef FORMATTING_H
#define FORMATTING_H

#include <QString>

/**
 * @brief Static helpers for presenting transfer data to the user.
 */
class Formatting
{
public:
    /**
     * @brief Formats a byte count using 1024-based units.
     * @param bytes The size in bytes.
     * @return "0 B", "512 B", "1.5 KB", ... up to PB.
     */
    [[nodiscard]] static QString formatFileSize(qint64 bytes);

    /**
     * @brief Estimates how long a transfer will take.
     * @param bytes Remaining bytes.
     * @param bytesPerSecond Observed throughput.
     * @return "12s", "3m 4s", "1h 2m", or "Unknown" for a non-positive rate.
     */
    [[nodiscard]] static QString estimateTransferTime(qint64 bytes, double bytesPerSecond);

    /**
     * @brief Turns a remote item name into a valid local file name.
     *
     * Characters that are invalid in file names are replaced with '_',
     * leading and trailing dots and spaces are removed, and the result is
     * limited to 255 characters while keeping the extension.
     */
    [[nodiscard]] static QString sanitizeFileName(const QString &name);
};

#endif // FORMATTING_H
