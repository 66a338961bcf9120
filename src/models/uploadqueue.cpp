#include "uploadqueue.h"
#include "utils/logging.h"

#include <QDebug>
#include <QFileInfo>
#include <QMutexLocker>
#include <QUuid>

#include <algorithm>

UploadQueue::UploadQueue(QObject *parent)
    : QObject(parent)
{
}

UploadQueue::~UploadQueue()
{
    // Abort whatever is still in flight so no handle outlives the session
    // holding a socket open. Handles are disconnected first, so nothing is
    // delivered back into this half-destroyed object.
    QList<QPointer<TransferHandle>> handles;
    {
        QMutexLocker locker(&mutex_);
        for (auto it = active_.cbegin(); it != active_.cend(); ++it) {
            handles.append(it->handle);
        }
        active_.clear();
    }
    for (const QPointer<TransferHandle> &handle : handles) {
        abortHandle(handle);
    }
}

// === Configuration ===

void UploadQueue::setActiveLimit(int limit)
{
    bool raised = false;
    {
        QMutexLocker locker(&mutex_);
        limit = std::max(1, limit);
        raised = limit > activeLimit_;
        activeLimit_ = limit;
    }

    // Lowering the limit never preempts; active transfers drain naturally
    if (raised) {
        emit admissionRequested();
    }
}

int UploadQueue::activeLimit() const
{
    QMutexLocker locker(&mutex_);
    return activeLimit_;
}

void UploadQueue::setRetryPolicy(const RetryPolicy &policy)
{
    QMutexLocker locker(&mutex_);
    retryPolicy_ = policy;
}

RetryPolicy UploadQueue::retryPolicy() const
{
    QMutexLocker locker(&mutex_);
    return retryPolicy_;
}

void UploadQueue::setDefaultDeclaredSize(qint64 bytes)
{
    QMutexLocker locker(&mutex_);
    aggregator_.setDefaultDeclaredSize(bytes);
}

// === Commands ===

QString UploadQueue::submit(const UploadFile &file)
{
    UploadTask task;
    task.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    task.sourcePath = file.sourcePath;
    task.displayName = file.displayName.isEmpty()
        ? QFileInfo(file.sourcePath).fileName()
        : file.displayName;
    task.declaredSize = std::max<qint64>(0, file.declaredSize);
    task.destinationHint = file.destinationHint;

    {
        QMutexLocker locker(&mutex_);
        task.maxRetries = retryPolicy_.maxRetries();
        tasks_.append(task);
    }

    qDebug() << "UploadQueue: Submitted" << courier::shortId(task.id) << task.displayName
             << "size:" << task.declaredSize;

    publishSnapshot();
    emit admissionRequested();
    return task.id;
}

void UploadQueue::cancel(const QString &id)
{
    QPointer<TransferHandle> handle;
    bool wasActive = false;
    bool finished = false;

    {
        QMutexLocker locker(&mutex_);
        int index = indexOf(id);
        if (index < 0) {
            LOG_VERBOSE() << "UploadQueue: Ignoring cancel for unknown task" << id;
            return;
        }
        if (tasks_.at(index).isTerminal()) {
            // A completion landed first; the cancel lost the race
            LOG_VERBOSE() << "UploadQueue: Ignoring cancel for finished task" << courier::shortId(id);
            return;
        }

        wasActive = tasks_.at(index).state == UploadState::Active;
        if (wasActive) {
            handle = releaseActiveLocked(id);
        }
        tasks_.removeAt(index);
        finished = pendingCountLocked() == 0;
    }

    abortHandle(handle);
    qDebug() << "UploadQueue: Cancelled" << courier::shortId(id) << (wasActive ? "(aborted transfer)" : "");

    emit uploadCancelled(id);
    publishSnapshot();
    if (wasActive) {
        emit admissionRequested();
    }
    if (finished) {
        emit allUploadsFinished();
    }
}

void UploadQueue::retry(const QString &id)
{
    {
        QMutexLocker locker(&mutex_);
        int index = indexOf(id);
        if (index < 0) {
            LOG_VERBOSE() << "UploadQueue: Ignoring retry for unknown task" << id;
            return;
        }
        if (!resetForRetryLocked(tasks_[index])) {
            LOG_VERBOSE() << "UploadQueue: Task" << courier::shortId(id) << "is not eligible for retry";
            return;
        }
    }

    qDebug() << "UploadQueue: Retrying" << courier::shortId(id);
    publishSnapshot();
    emit admissionRequested();
}

void UploadQueue::retryAll()
{
    int retried = 0;
    {
        QMutexLocker locker(&mutex_);
        for (UploadTask &task : tasks_) {
            if (resetForRetryLocked(task)) {
                ++retried;
            }
        }
    }

    if (retried == 0) {
        LOG_VERBOSE() << "UploadQueue: retryAll found no eligible tasks";
        return;
    }

    qDebug() << "UploadQueue: Retrying" << retried << "failed uploads";
    publishSnapshot();
    emit admissionRequested();
}

void UploadQueue::clearCompleted()
{
    qsizetype removed = 0;
    {
        QMutexLocker locker(&mutex_);
        removed = tasks_.removeIf([](const UploadTask &task) {
            return task.state == UploadState::Succeeded;
        });
    }

    if (removed > 0) {
        LOG_VERBOSE() << "UploadQueue: Cleared" << removed << "completed uploads";
        publishSnapshot();
    }
}

void UploadQueue::pauseAll()
{
    QList<QPointer<TransferHandle>> handles;
    bool changed = false;
    {
        QMutexLocker locker(&mutex_);
        changed = !paused_ || !active_.isEmpty();
        paused_ = true;

        for (UploadTask &task : tasks_) {
            if (task.state == UploadState::Active) {
                // Back to Waiting without spending a retry
                task.state = UploadState::Waiting;
                task.progressPercent = 0;
                task.throughputEstimate = 0.0;
            }
        }
        for (auto it = active_.cbegin(); it != active_.cend(); ++it) {
            handles.append(it->handle);
        }
        active_.clear();
    }

    for (const QPointer<TransferHandle> &handle : handles) {
        abortHandle(handle);
    }

    if (changed) {
        qDebug() << "UploadQueue: Paused, aborted" << handles.size() << "active uploads";
        publishSnapshot();
    }
}

void UploadQueue::resumeAll()
{
    {
        QMutexLocker locker(&mutex_);
        if (!paused_) {
            return;
        }
        paused_ = false;
    }

    qDebug() << "UploadQueue: Resumed";
    publishSnapshot();
    emit admissionRequested();
}

void UploadQueue::clear()
{
    QList<QPointer<TransferHandle>> handles;
    {
        QMutexLocker locker(&mutex_);
        for (auto it = active_.cbegin(); it != active_.cend(); ++it) {
            handles.append(it->handle);
        }
        active_.clear();
        tasks_.clear();
        paused_ = false;
    }

    for (const QPointer<TransferHandle> &handle : handles) {
        abortHandle(handle);
    }

    qDebug() << "UploadQueue: Cleared";
    publishSnapshot();
}

// === Queries ===

QList<UploadTask> UploadQueue::tasks() const
{
    QMutexLocker locker(&mutex_);
    return tasks_;
}

std::optional<UploadTask> UploadQueue::task(const QString &id) const
{
    QMutexLocker locker(&mutex_);
    int index = indexOf(id);
    if (index < 0) {
        return std::nullopt;
    }
    return tasks_.at(index);
}

int UploadQueue::activeCount() const
{
    QMutexLocker locker(&mutex_);
    return static_cast<int>(active_.size());
}

int UploadQueue::waitingCount() const
{
    QMutexLocker locker(&mutex_);
    return static_cast<int>(std::count_if(tasks_.cbegin(), tasks_.cend(), [](const UploadTask &task) {
        return task.state == UploadState::Waiting;
    }));
}

int UploadQueue::count() const
{
    QMutexLocker locker(&mutex_);
    return static_cast<int>(tasks_.size());
}

bool UploadQueue::isPaused() const
{
    QMutexLocker locker(&mutex_);
    return paused_;
}

UploadSnapshot UploadQueue::snapshot() const
{
    QMutexLocker locker(&mutex_);
    return aggregator_.aggregate(tasks_, paused_);
}

// === Scheduler interface ===

std::optional<UploadAdmission> UploadQueue::admitNext()
{
    UploadAdmission admission;
    {
        QMutexLocker locker(&mutex_);
        if (paused_ || active_.size() >= activeLimit_) {
            return std::nullopt;
        }

        // FIFO: tasks_ is in submission order and retried tasks keep their place
        auto it = std::find_if(tasks_.begin(), tasks_.end(), [](const UploadTask &task) {
            return task.state == UploadState::Waiting;
        });
        if (it == tasks_.end()) {
            return std::nullopt;
        }

        it->state = UploadState::Active;
        it->progressPercent = 0;
        it->throughputEstimate = 0.0;
        it->attempt += 1;

        ActiveTransfer transfer;
        transfer.attempt = it->attempt;
        active_.insert(it->id, transfer);

        admission.taskId = it->id;
        admission.attempt = it->attempt;
        admission.sourcePath = it->sourcePath;
        admission.destinationHint = it->destinationHint;
    }

    LOG_VERBOSE() << "UploadQueue: Admitted" << courier::shortId(admission.taskId)
                  << "attempt" << admission.attempt;

    emit uploadStarted(admission.taskId);
    publishSnapshot();
    return admission;
}

bool UploadQueue::attachHandle(const QString &id, int attempt, TransferHandle *handle)
{
    QMutexLocker locker(&mutex_);
    auto it = active_.find(id);
    if (it == active_.end() || it->attempt != attempt) {
        return false;
    }
    it->handle = handle;
    return true;
}

void UploadQueue::recordProgress(const QString &id, int attempt, int percent, double throughputEstimate)
{
    {
        QMutexLocker locker(&mutex_);
        if (!isCurrentAttempt(id, attempt)) {
            return;
        }

        UploadTask &task = tasks_[indexOf(id)];
        ActiveTransfer &transfer = active_[id];

        // Never move backwards within one attempt
        task.progressPercent = std::max(task.progressPercent, std::clamp(percent, 0, 100));
        if (throughputEstimate > 0.0) {
            transfer.meter.addSample(throughputEstimate);
        }
        task.throughputEstimate = transfer.meter.mean();
    }

    LOG_VERBOSE() << "UploadQueue: Progress" << courier::shortId(id) << percent << "%";
    publishSnapshot();
}

void UploadQueue::recordSuccess(const QString &id, int attempt, const QString &resultLocation, qint64 elapsedMs)
{
    QPointer<TransferHandle> handle;
    bool finished = false;
    {
        QMutexLocker locker(&mutex_);
        if (!isCurrentAttempt(id, attempt)) {
            LOG_VERBOSE() << "UploadQueue: Dropping stale success for" << courier::shortId(id);
            return;
        }

        UploadTask &task = tasks_[indexOf(id)];
        task.state = UploadState::Succeeded;
        task.progressPercent = 100;
        task.throughputEstimate = 0.0;
        task.resultLocation = resultLocation;
        task.elapsedMs = elapsedMs;
        task.lastError = UploadError();

        handle = releaseActiveLocked(id);
        finished = pendingCountLocked() == 0;
    }

    discardHandle(handle);
    qDebug() << "UploadQueue: Upload succeeded" << courier::shortId(id) << "->" << resultLocation
             << "in" << elapsedMs << "ms";

    emit uploadSucceeded(id, resultLocation);
    publishSnapshot();
    emit admissionRequested();
    if (finished) {
        emit allUploadsFinished();
    }
}

void UploadQueue::recordFailure(const QString &id, int attempt, const UploadError &error)
{
    QPointer<TransferHandle> handle;
    bool finished = false;
    bool retryable = false;
    {
        QMutexLocker locker(&mutex_);
        if (!isCurrentAttempt(id, attempt)) {
            LOG_VERBOSE() << "UploadQueue: Dropping stale failure for" << courier::shortId(id);
            return;
        }

        UploadTask &task = tasks_[indexOf(id)];
        task.state = UploadState::Failed;
        task.throughputEstimate = 0.0;
        task.lastError = error;
        // Once the budget is spent the failure is final, whatever its kind
        task.retryable = retryPolicy_.isRetryable(error, task.retryCount, task.maxRetries);
        retryable = task.retryable;

        handle = releaseActiveLocked(id);
        finished = pendingCountLocked() == 0;
    }

    discardHandle(handle);
    qWarning() << "UploadQueue: Upload failed" << courier::shortId(id)
               << uploadErrorKindToString(error.kind) << error.message
               << (retryable ? "(retryable)" : "(final)");

    emit uploadFailed(id, error);
    publishSnapshot();
    emit admissionRequested();
    if (finished) {
        emit allUploadsFinished();
    }
}

// === Private helpers ===

int UploadQueue::indexOf(const QString &id) const
{
    for (int i = 0; i < tasks_.size(); ++i) {
        if (tasks_.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

int UploadQueue::pendingCountLocked() const
{
    return static_cast<int>(std::count_if(tasks_.cbegin(), tasks_.cend(), [](const UploadTask &task) {
        return !task.isTerminal();
    }));
}

bool UploadQueue::isCurrentAttempt(const QString &id, int attempt) const
{
    auto it = active_.constFind(id);
    return it != active_.cend() && it->attempt == attempt;
}

bool UploadQueue::resetForRetryLocked(UploadTask &task)
{
    if (!retryPolicy_.canRetry(task)) {
        return false;
    }

    task.state = UploadState::Waiting;
    task.progressPercent = 0;
    task.throughputEstimate = 0.0;
    task.retryCount += 1;
    task.lastError = UploadError();
    return true;
}

QPointer<TransferHandle> UploadQueue::releaseActiveLocked(const QString &id)
{
    QPointer<TransferHandle> handle;
    auto it = active_.find(id);
    if (it != active_.end()) {
        handle = it->handle;
        active_.erase(it);
    }
    return handle;
}

void UploadQueue::abortHandle(const QPointer<TransferHandle> &handle)
{
    if (!handle) {
        return;
    }
    // Drop our connections before aborting so a late signal cannot reach the queue
    handle->disconnect();
    handle->abort();
    handle->deleteLater();
}

void UploadQueue::discardHandle(const QPointer<TransferHandle> &handle)
{
    if (handle) {
        handle->disconnect();
        handle->deleteLater();
    }
}

void UploadQueue::publishSnapshot()
{
    emit snapshotChanged(snapshot());
}
