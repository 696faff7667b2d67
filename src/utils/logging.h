/**
 * @file logging.h
 * @brief Simple logging utility with runtime verbose flag.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>

namespace ftpsync {

/// Global verbose logging flag, set via --verbose command line argument
inline bool verboseLogging = false;

} // namespace ftpsync

/// Log only when verbose mode is enabled (protocol traffic, strategy traces)
#define LOG_VERBOSE() if (ftpsync::verboseLogging) qDebug()

#endif // LOGGING_H
