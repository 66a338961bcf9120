/**
 * @file backoffretrier.h
 * @brief Optional delayed retry of transient upload failures.
 */

#ifndef BACKOFFRETRIER_H
#define BACKOFFRETRIER_H

#include <QHash>
#include <QObject>
#include <QPointer>
#include <QString>

#include "models/uploaderror.h"
#include "services/retrypolicy.h"

class QTimer;
class UploadQueue;

/**
 * @brief Re-submits retryable failures after a linear backoff delay.
 *
 * The queue itself never retries. This caller-side layer watches
 * UploadQueue::uploadFailed() and, while enabled, schedules retry() for tasks
 * the policy still considers eligible. The n-th retry waits base x n ms.
 * A pending retry is dropped if the task is cancelled, retried manually or
 * the queue is cleared in the meantime.
 */
class BackoffRetrier : public QObject
{
    Q_OBJECT

public:
    explicit BackoffRetrier(UploadQueue *queue, QObject *parent = nullptr);
    ~BackoffRetrier() override;

    void setEnabled(bool enabled);
    [[nodiscard]] bool isEnabled() const { return enabled_; }

    [[nodiscard]] bool hasPendingRetries() const { return !timers_.isEmpty(); }
    [[nodiscard]] int pendingRetryCount() const { return timers_.size(); }

    /// Cancels every scheduled retry.
    void cancelPending();

signals:
    /// A retry was scheduled to fire after @p delayMs.
    void retryScheduled(const QString &id, int delayMs);
    /// The scheduled retry fired and the task went back to Waiting.
    void retryIssued(const QString &id);

private slots:
    void onUploadFailed(const QString &id, const UploadError &error);
    void onUploadCancelled(const QString &id);

private:
    void fire(const QString &id);
    void dropTimer(const QString &id);

    QPointer<UploadQueue> queue_;
    bool enabled_ = false;
    QHash<QString, QTimer*> timers_;
};

#endif // BACKOFFRETRIER_H
