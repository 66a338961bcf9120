/**
 * @file uploadsnapshot.h
 * @brief Aggregate view of an upload queue at one point in time.
 */

#ifndef UPLOADSNAPSHOT_H
#define UPLOADSNAPSHOT_H

#include <QList>
#include <QMetaType>

#include "uploadtask.h"

struct UploadCounts {
    int total = 0;
    int waiting = 0;
    int active = 0;
    int succeeded = 0;
    int failed = 0;

    [[nodiscard]] int pending() const { return waiting + active; }
};

/**
 * @brief Derived state handed to presenters after every queue mutation.
 */
struct UploadSnapshot {
    QList<UploadTask> tasks;
    int overallProgress = 0;              ///< 0-100, 100 only when every task succeeded
    double averageThroughput = 0.0;       ///< Mean bytes/second over active tasks
    qint64 estimatedRemainingSeconds = 0; ///< 0 when throughput is unknown
    UploadCounts counts;
    bool paused = false;
    bool allFailed = false;               ///< Non-empty queue where every task failed

    [[nodiscard]] bool isEmpty() const { return counts.total == 0; }
    [[nodiscard]] bool isFinished() const { return counts.total > 0 && counts.pending() == 0; }
};

Q_DECLARE_METATYPE(UploadSnapshot)

#endif // UPLOADSNAPSHOT_H
