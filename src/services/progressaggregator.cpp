#include "progressaggregator.h"

#include <algorithm>
#include <cmath>

ProgressAggregator::ProgressAggregator(qint64 defaultDeclaredSize)
    : defaultDeclaredSize_(std::max<qint64>(0, defaultDeclaredSize))
{
}

void ProgressAggregator::setDefaultDeclaredSize(qint64 bytes)
{
    defaultDeclaredSize_ = std::max<qint64>(0, bytes);
}

UploadSnapshot ProgressAggregator::aggregate(const QList<UploadTask> &tasks, bool paused) const
{
    UploadSnapshot snapshot;
    snapshot.tasks = tasks;
    snapshot.counts = count(tasks);
    snapshot.overallProgress = overallProgress(tasks);
    snapshot.averageThroughput = averageThroughput(tasks);
    snapshot.estimatedRemainingSeconds = estimatedRemainingSeconds(tasks, snapshot.averageThroughput);
    snapshot.paused = paused;
    snapshot.allFailed = snapshot.counts.total > 0
        && snapshot.counts.failed == snapshot.counts.total;
    return snapshot;
}

int ProgressAggregator::overallProgress(const QList<UploadTask> &tasks)
{
    if (tasks.isEmpty()) {
        return 0;
    }

    qint64 sum = 0;
    bool allSucceeded = true;
    for (const UploadTask &task : tasks) {
        switch (task.state) {
        case UploadState::Succeeded:
            sum += 100;
            break;
        case UploadState::Active:
            sum += std::clamp(task.progressPercent, 0, 100);
            allSucceeded = false;
            break;
        case UploadState::Waiting:
        case UploadState::Failed:
            allSucceeded = false;
            break;
        }
    }

    int progress = static_cast<int>(std::lround(static_cast<double>(sum) / tasks.size()));
    progress = std::clamp(progress, 0, 100);
    if (progress == 100 && !allSucceeded) {
        progress = 99;
    }
    return progress;
}

double ProgressAggregator::averageThroughput(const QList<UploadTask> &tasks)
{
    double sum = 0.0;
    int active = 0;
    for (const UploadTask &task : tasks) {
        if (task.state == UploadState::Active) {
            sum += std::max(0.0, task.throughputEstimate);
            ++active;
        }
    }
    return active == 0 ? 0.0 : sum / active;
}

qint64 ProgressAggregator::remainingBytes(const QList<UploadTask> &tasks) const
{
    double remaining = 0.0;
    for (const UploadTask &task : tasks) {
        if (task.state == UploadState::Active) {
            int percent = std::clamp(task.progressPercent, 0, 100);
            remaining += static_cast<double>(task.declaredSize) * (100 - percent) / 100.0;
        } else if (task.state == UploadState::Waiting) {
            remaining += task.declaredSize > 0 ? task.declaredSize : defaultDeclaredSize_;
        }
    }
    return static_cast<qint64>(std::llround(remaining));
}

qint64 ProgressAggregator::estimatedRemainingSeconds(const QList<UploadTask> &tasks,
                                                     double throughput) const
{
    if (throughput <= 0.0) {
        return 0;
    }
    return static_cast<qint64>(std::llround(remainingBytes(tasks) / throughput));
}

UploadCounts ProgressAggregator::count(const QList<UploadTask> &tasks)
{
    UploadCounts counts;
    counts.total = tasks.size();
    for (const UploadTask &task : tasks) {
        switch (task.state) {
        case UploadState::Waiting: ++counts.waiting; break;
        case UploadState::Active: ++counts.active; break;
        case UploadState::Succeeded: ++counts.succeeded; break;
        case UploadState::Failed: ++counts.failed; break;
        }
    }
    return counts;
}
