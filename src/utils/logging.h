/**
 * @file logging.h
 * @brief Simple logging utility with runtime verbose flag.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>

namespace drivebatch {

/// Global verbose logging flag, set via --verbose or the DEBUG log level
inline bool verboseLogging = false;

} // namespace drivebatch

/// Log only when verbose mode is enabled
#define LOG_VERBOSE() if (drivebatch::verboseLogging) qDebug()

#endif // LOGGING_H
