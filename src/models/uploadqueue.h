#ifndef UPLOADQUEUE_H
#define UPLOADQUEUE_H

#include <QHash>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QPointer>
#include <QString>

#include <optional>

#include "models/uploadsnapshot.h"
#include "models/uploadtask.h"
#include "services/itransferclient.h"  // Full include needed for QPointer
#include "services/progressaggregator.h"
#include "services/retrypolicy.h"
#include "utils/throughputmeter.h"

/**
 * @brief A task moved to Active by an admission pass, ready to be started.
 */
struct UploadAdmission {
    QString taskId;
    int attempt = 0;
    QString sourcePath;
    QString destinationHint;
};

/**
 * @brief Ordered upload tasks plus a bounded set of active transfers.
 *
 * One queue exists per upload session and is owned by whoever drives the
 * session. The queue holds state and exposes the command surface; starting
 * transfers is left to an UploadScheduler connected to admissionRequested().
 *
 * All mutable state is guarded by a single mutex. Signals are emitted after
 * the lock is released, so receivers may call back into the queue.
 *
 * @par Example usage:
 * @code
 * UploadQueue queue;
 * UploadScheduler scheduler(&queue, transferClient);
 *
 * connect(&queue, &UploadQueue::snapshotChanged,
 *         this, &MyWidget::render);
 *
 * QString id = queue.submit({"/tmp/photo.jpg", "photo.jpg", 52311, "/upload"});
 * queue.cancel(id);
 * @endcode
 */
class UploadQueue : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultActiveLimit = 3;

    explicit UploadQueue(QObject *parent = nullptr);
    ~UploadQueue() override;

    /// @name Configuration
    /// @{
    void setActiveLimit(int limit);
    [[nodiscard]] int activeLimit() const;

    /// Replaces the retry policy; its maxRetries applies to tasks submitted afterwards.
    void setRetryPolicy(const RetryPolicy &policy);
    [[nodiscard]] RetryPolicy retryPolicy() const;

    void setDefaultDeclaredSize(qint64 bytes);
    /// @}

    /// @name Commands
    /// @{
    QString submit(const UploadFile &file);
    void cancel(const QString &id);
    void retry(const QString &id);
    void retryAll();
    void clearCompleted();
    void pauseAll();
    void resumeAll();
    void clear();
    /// @}

    /// @name Queries
    /// @{
    [[nodiscard]] QList<UploadTask> tasks() const;
    [[nodiscard]] std::optional<UploadTask> task(const QString &id) const;
    [[nodiscard]] int activeCount() const;
    [[nodiscard]] int waitingCount() const;
    [[nodiscard]] int count() const;
    [[nodiscard]] bool isPaused() const;
    [[nodiscard]] UploadSnapshot snapshot() const;
    /// @}

    /// @name Scheduler interface
    /// Called by UploadScheduler; every call is validated against the attempt
    /// number so events from cancelled or paused attempts are dropped.
    /// @{

    /**
     * @brief Moves the earliest Waiting task to Active if capacity allows.
     * @return The admitted task, or nothing when paused, full or idle.
     */
    [[nodiscard]] std::optional<UploadAdmission> admitNext();

    /**
     * @brief Stores the live handle of an admitted attempt.
     * @return False if the attempt was cancelled or paused meanwhile; the
     *         caller must then abort and discard the handle.
     */
    [[nodiscard]] bool attachHandle(const QString &id, int attempt, TransferHandle *handle);

    void recordProgress(const QString &id, int attempt, int percent, double throughputEstimate);
    void recordSuccess(const QString &id, int attempt, const QString &resultLocation, qint64 elapsedMs);
    void recordFailure(const QString &id, int attempt, const UploadError &error);
    /// @}

signals:
    /// Capacity freed or work arrived; the scheduler runs an admission pass.
    void admissionRequested();

    /// Emitted after every mutation with the re-derived aggregate state.
    /// A mutation publishes before it requests admission, so a retried or
    /// resumed task is observed Waiting before it is observed Active.
    void snapshotChanged(const UploadSnapshot &snapshot);

    void uploadStarted(const QString &id);
    void uploadSucceeded(const QString &id, const QString &resultLocation);
    void uploadFailed(const QString &id, const UploadError &error);
    void uploadCancelled(const QString &id);

    /// The last Waiting or Active task reached a terminal state (or was cancelled).
    void allUploadsFinished();

private:
    struct ActiveTransfer {
        int attempt = 0;
        QPointer<TransferHandle> handle;  // Null between admission and attachHandle()
        ThroughputMeter meter;
    };

    // Callers hold mutex_
    [[nodiscard]] int indexOf(const QString &id) const;
    [[nodiscard]] int pendingCountLocked() const;
    [[nodiscard]] bool isCurrentAttempt(const QString &id, int attempt) const;
    bool resetForRetryLocked(UploadTask &task);
    QPointer<TransferHandle> releaseActiveLocked(const QString &id);

    static void abortHandle(const QPointer<TransferHandle> &handle);
    static void discardHandle(const QPointer<TransferHandle> &handle);

    void publishSnapshot();

    mutable QMutex mutex_;
    QList<UploadTask> tasks_;
    QHash<QString, ActiveTransfer> active_;
    int activeLimit_ = DefaultActiveLimit;
    bool paused_ = false;
    RetryPolicy retryPolicy_;
    ProgressAggregator aggregator_;
};

#endif // UPLOADQUEUE_H
