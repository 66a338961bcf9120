/**
 * @file uploadtask.h
 * @brief Value types describing one file's upload job.
 */

#ifndef UPLOADTASK_H
#define UPLOADTASK_H

#include <QMetaType>
#include <QString>

#include "uploaderror.h"

/**
 * @brief Lifecycle state of an upload task.
 *
 * Allowed transitions: Waiting->Active, Active->Succeeded, Active->Failed,
 * Failed->Waiting (retry) and Active->Waiting (pause). Cancelled tasks are
 * removed from the queue instead of getting a state of their own.
 */
enum class UploadState { Waiting, Active, Succeeded, Failed };

[[nodiscard]] inline const char* uploadStateToString(UploadState state) {
    switch (state) {
        case UploadState::Waiting: return "Waiting";
        case UploadState::Active: return "Active";
        case UploadState::Succeeded: return "Succeeded";
        case UploadState::Failed: return "Failed";
    }
    return "Unknown";
}

/**
 * @brief A file handed to the queue by the caller.
 *
 * The source file is owned by the caller and must stay readable for the
 * lifetime of the task (compressed images live in a temporary directory the
 * caller cleans up after the session).
 */
struct UploadFile {
    QString sourcePath;
    QString displayName;      // Defaults to the file name of sourcePath
    qint64 declaredSize = 0;  // 0 when unknown
    QString destinationHint;  // Passed through to the transfer client
};

struct UploadTask {
    static constexpr int DefaultMaxRetries = 3;

    QString id;
    QString sourcePath;
    QString displayName;
    qint64 declaredSize = 0;
    QString destinationHint;

    UploadState state = UploadState::Waiting;
    int progressPercent = 0;         // Only meaningful while Active
    double throughputEstimate = 0.0; // Bytes per second, smoothed

    int retryCount = 0;
    int maxRetries = DefaultMaxRetries;
    bool retryable = true;
    int attempt = 0;                 // Number of admissions so far

    QString resultLocation;          // Set on success
    qint64 elapsedMs = 0;            // Duration of the successful attempt
    UploadError lastError;           // Set on failure

    [[nodiscard]] bool isTerminal() const {
        return state == UploadState::Succeeded || state == UploadState::Failed;
    }
};

Q_DECLARE_METATYPE(UploadTask)

#endif // UPLOADTASK_H
