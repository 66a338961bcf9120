/**
 * @file progressaggregator.h
 * @brief Derives overall progress, throughput and ETA from queue tasks.
 */

#ifndef PROGRESSAGGREGATOR_H
#define PROGRESSAGGREGATOR_H

#include <QList>

#include "models/uploadsnapshot.h"
#include "models/uploadtask.h"

/**
 * @brief Pure computation of the aggregate snapshot.
 *
 * No I/O and no state besides the size assumed for waiting files whose size
 * is unknown. The queue re-runs it after every transition.
 */
class ProgressAggregator
{
public:
    static constexpr qint64 DefaultDeclaredSize = 1024 * 1024;  // 1 MiB

    explicit ProgressAggregator(qint64 defaultDeclaredSize = DefaultDeclaredSize);

    [[nodiscard]] qint64 defaultDeclaredSize() const { return defaultDeclaredSize_; }
    void setDefaultDeclaredSize(qint64 bytes);

    /**
     * @brief Builds the full snapshot for @p tasks.
     * @param tasks Tasks in submission order.
     * @param paused Whether admission is currently held.
     */
    [[nodiscard]] UploadSnapshot aggregate(const QList<UploadTask> &tasks, bool paused = false) const;

    /**
     * @brief Rounded mean of per-task contributions (100 succeeded, progress active, 0 otherwise).
     *
     * Returns 100 only if every task succeeded; a queue that would round up
     * to 100 with work outstanding reports 99.
     */
    [[nodiscard]] static int overallProgress(const QList<UploadTask> &tasks);

    /// Mean throughput over active tasks, 0 if none are active.
    [[nodiscard]] static double averageThroughput(const QList<UploadTask> &tasks);

    /// Remaining bytes over waiting and active tasks.
    [[nodiscard]] qint64 remainingBytes(const QList<UploadTask> &tasks) const;

    /// Remaining seconds at @p throughput bytes/second, 0 when throughput is 0.
    [[nodiscard]] qint64 estimatedRemainingSeconds(const QList<UploadTask> &tasks,
                                                   double throughput) const;

    [[nodiscard]] static UploadCounts count(const QList<UploadTask> &tasks);

private:
    qint64 defaultDeclaredSize_;
};

#endif // PROGRESSAGGREGATOR_H
