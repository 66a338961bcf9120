/**
 * @file uploadscheduler.h
 * @brief Admission control between the upload queue and a transfer client.
 */

#ifndef UPLOADSCHEDULER_H
#define UPLOADSCHEDULER_H

#include <QMutex>
#include <QObject>
#include <QPointer>

#include "models/uploadqueue.h"
#include "services/itransferclient.h"

/**
 * @brief Starts Waiting tasks while the queue has capacity.
 *
 * The scheduler listens to UploadQueue::admissionRequested() and runs an
 * admission pass: it repeatedly asks the queue for the earliest Waiting task,
 * starts its transfer and wires the handle's signals back into the queue,
 * until capacity or work runs out. It never preempts an Active task.
 *
 * Passes are mutually exclusive. A request that arrives while a pass is
 * running (from another thread, or re-entrantly from a signal emitted inside
 * the pass) makes the running pass loop once more instead of starting a
 * second one.
 *
 * Every handle signal is tagged with the task id and attempt number it was
 * started for; the queue drops events whose attempt is no longer current.
 */
class UploadScheduler : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a scheduler.
     * @param queue The queue to admit tasks from (not owned).
     * @param client The transfer client used to start uploads (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit UploadScheduler(UploadQueue *queue,
                             ITransferClient *client,
                             QObject *parent = nullptr);
    ~UploadScheduler() override;

    void setTransferClient(ITransferClient *client);
    [[nodiscard]] ITransferClient* transferClient() const { return client_; }

    /// Number of admission passes run so far (for diagnostics).
    [[nodiscard]] int passCount() const;

public slots:
    /**
     * @brief Runs an admission pass, or marks the running one for another round.
     */
    void requestAdmission();

private:
    void admitWhileCapacity();
    void startTransfer(const UploadAdmission &admission);

    QPointer<UploadQueue> queue_;
    QPointer<ITransferClient> client_;

    mutable QMutex passMutex_;
    bool passRunning_ = false;
    bool passPending_ = false;
    int passCount_ = 0;
};

#endif // UPLOADSCHEDULER_H
