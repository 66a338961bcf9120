#include "backoffretrier.h"
#include "models/uploadqueue.h"
#include "utils/logging.h"

#include <QDebug>
#include <QTimer>

#include <utility>

BackoffRetrier::BackoffRetrier(UploadQueue *queue, QObject *parent)
    : QObject(parent)
    , queue_(queue)
{
    connect(queue_, &UploadQueue::uploadFailed,
            this, &BackoffRetrier::onUploadFailed);
    connect(queue_, &UploadQueue::uploadCancelled,
            this, &BackoffRetrier::onUploadCancelled);
}

BackoffRetrier::~BackoffRetrier()
{
    if (queue_) {
        disconnect(queue_, nullptr, this, nullptr);
    }
}

void BackoffRetrier::setEnabled(bool enabled)
{
    enabled_ = enabled;
    if (!enabled_) {
        cancelPending();
    }
}

void BackoffRetrier::cancelPending()
{
    for (QTimer *timer : std::as_const(timers_)) {
        timer->stop();
        timer->deleteLater();
    }
    timers_.clear();
}

void BackoffRetrier::onUploadFailed(const QString &id, const UploadError &error)
{
    if (!enabled_ || !queue_ || !error.isTransient()) {
        return;
    }

    std::optional<UploadTask> task = queue_->task(id);
    RetryPolicy policy = queue_->retryPolicy();
    if (!task || !policy.canRetry(*task)) {
        return;
    }

    dropTimer(id);

    int delayMs = policy.backoffDelayMs(task->retryCount + 1);
    auto *timer = new QTimer(this);
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, this, [this, id]() { fire(id); });
    timers_.insert(id, timer);
    timer->start(delayMs);

    qDebug() << "BackoffRetrier: Retrying" << courier::shortId(id) << "in" << delayMs << "ms";
    emit retryScheduled(id, delayMs);
}

void BackoffRetrier::onUploadCancelled(const QString &id)
{
    dropTimer(id);
}

void BackoffRetrier::fire(const QString &id)
{
    dropTimer(id);
    if (!queue_) {
        return;
    }

    // The task may have been retried by hand or cleared since the failure
    std::optional<UploadTask> task = queue_->task(id);
    if (!task || !queue_->retryPolicy().canRetry(*task)) {
        LOG_VERBOSE() << "BackoffRetrier: Task" << courier::shortId(id) << "no longer eligible";
        return;
    }

    queue_->retry(id);
    emit retryIssued(id);
}

void BackoffRetrier::dropTimer(const QString &id)
{
    QTimer *timer = timers_.take(id);
    if (timer) {
        timer->stop();
        timer->deleteLater();
    }
}
