/**
 * @file logging.h
 * @brief Logging helpers shared by the upload pipeline.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>
#include <QString>

namespace courier {

/// Global verbose logging flag, set via --verbose command line argument
inline bool verboseLogging = false;

/// Task ids are UUIDs; the first block is enough to tell tasks apart in logs
[[nodiscard]] inline QString shortId(const QString &taskId)
{
    return taskId.left(8);
}

} // namespace courier

/// Log only when verbose mode is enabled (per-event chatter: progress, admissions)
#define LOG_VERBOSE() if (courier::verboseLogging) qDebug()

#endif // LOGGING_H
