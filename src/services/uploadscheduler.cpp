#include "uploadscheduler.h"
#include "utils/logging.h"

#include <QDebug>
#include <QMutexLocker>

UploadScheduler::UploadScheduler(UploadQueue *queue,
                                 ITransferClient *client,
                                 QObject *parent)
    : QObject(parent)
    , queue_(queue)
    , client_(client)
{
    // Direct connection: admission happens synchronously when capacity frees,
    // before the queue publishes the snapshot for the triggering mutation
    connect(queue_, &UploadQueue::admissionRequested,
            this, &UploadScheduler::requestAdmission, Qt::DirectConnection);
}

UploadScheduler::~UploadScheduler()
{
    if (queue_) {
        disconnect(queue_, nullptr, this, nullptr);
    }
}

void UploadScheduler::setTransferClient(ITransferClient *client)
{
    client_ = client;
    requestAdmission();
}

int UploadScheduler::passCount() const
{
    QMutexLocker locker(&passMutex_);
    return passCount_;
}

void UploadScheduler::requestAdmission()
{
    {
        QMutexLocker locker(&passMutex_);
        passPending_ = true;
        if (passRunning_) {
            // The running pass picks this up before it finishes
            return;
        }
        passRunning_ = true;
    }

    for (;;) {
        {
            QMutexLocker locker(&passMutex_);
            if (!passPending_) {
                passRunning_ = false;
                return;
            }
            passPending_ = false;
            ++passCount_;
        }
        admitWhileCapacity();
    }
}

void UploadScheduler::admitWhileCapacity()
{
    if (!queue_) {
        return;
    }
    if (!client_) {
        LOG_VERBOSE() << "UploadScheduler: No transfer client, leaving tasks waiting";
        return;
    }

    while (auto admission = queue_->admitNext()) {
        startTransfer(*admission);
    }
}

void UploadScheduler::startTransfer(const UploadAdmission &admission)
{
    TransferHandle *handle = client_->start(admission.sourcePath, admission.destinationHint);
    if (!handle) {
        UploadError error;
        error.kind = UploadErrorKind::Permanent;
        error.message = tr("Could not start upload of %1").arg(admission.sourcePath);
        queue_->recordFailure(admission.taskId, admission.attempt, error);
        return;
    }

    const QString id = admission.taskId;
    const int attempt = admission.attempt;
    QPointer<UploadQueue> queue = queue_;

    connect(handle, &TransferHandle::progressChanged, this,
            [queue, id, attempt](int percent, double throughputEstimate) {
        if (queue) {
            queue->recordProgress(id, attempt, percent, throughputEstimate);
        }
    });
    connect(handle, &TransferHandle::succeeded, this,
            [queue, id, attempt](const QString &resultLocation, qint64 elapsedMs) {
        if (queue) {
            queue->recordSuccess(id, attempt, resultLocation, elapsedMs);
        }
    });
    connect(handle, &TransferHandle::failed, this,
            [queue, id, attempt](const QString &message, int statusCode) {
        if (queue) {
            queue->recordFailure(id, attempt, queue->retryPolicy().classify(message, statusCode));
        }
    });

    if (!queue_->attachHandle(admission.taskId, admission.attempt, handle)) {
        // Cancelled or paused between admission and start
        LOG_VERBOSE() << "UploadScheduler: Attempt" << admission.attempt << "of"
                      << courier::shortId(admission.taskId) << "was withdrawn, aborting";
        handle->disconnect();
        handle->abort();
        handle->deleteLater();
        return;
    }

    LOG_VERBOSE() << "UploadScheduler: Started" << courier::shortId(id) << "attempt" << attempt;
}
