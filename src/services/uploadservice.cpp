#include "uploadservice.h"
#include "errorhandler.h"
#include "retrypolicy.h"
#include "uploadpresenter.h"
#include "utils/logging.h"

#include <QDebug>
#include <QFileInfo>
#include <QLocale>

UploadService::UploadService(UploadQueue *queue, QObject *parent)
    : QObject(parent)
    , queue_(queue)
    , errorHandler_(new ErrorHandler(this))
{
    // Forward signals from UploadQueue
    connect(queue_, &UploadQueue::snapshotChanged,
            this, &UploadService::onSnapshotChanged);
    connect(queue_, &UploadQueue::uploadStarted,
            this, &UploadService::uploadStarted);
    connect(queue_, &UploadQueue::uploadSucceeded,
            this, &UploadService::uploadSucceeded);
    connect(queue_, &UploadQueue::uploadFailed,
            this, &UploadService::onUploadFailed);
    connect(queue_, &UploadQueue::uploadCancelled,
            this, &UploadService::uploadCancelled);
    connect(queue_, &UploadQueue::allUploadsFinished,
            this, &UploadService::allUploadsFinished);

    connect(errorHandler_, &ErrorHandler::statusMessage,
            this, &UploadService::onStatusMessage);
    connect(errorHandler_, &ErrorHandler::blockingErrorRaised,
            this, &UploadService::onBlockingError);
}

UploadService::~UploadService()
{
    if (presenter_) {
        presenter_->setCommandSink(nullptr);
    }
}

void UploadService::applySettings(const UploadSettings &settings)
{
    settings_ = settings.normalized();
    queue_->setRetryPolicy(RetryPolicy(settings_.maxRetries, settings_.retryBaseDelayMs));
    queue_->setDefaultDeclaredSize(settings_.defaultDeclaredSize);
    queue_->setActiveLimit(settings_.activeLimit);
}

void UploadService::setPresenter(UploadPresenter *presenter)
{
    if (presenter_) {
        presenter_->setCommandSink(nullptr);
    }
    presenter_ = presenter;
    if (presenter_) {
        presenter_->setCommandSink(this);
        presenter_->render(queue_->snapshot());
    }
}

QString UploadService::uploadFile(const QString &localPath, const QString &destinationHint)
{
    qint64 size = 0;
    QString reason;
    if (settings_.maxFileCount > 0 && queue_->count() >= settings_.maxFileCount) {
        reason = tr("Too many files, at most %1 per session").arg(settings_.maxFileCount);
    } else {
        reason = validateFile(localPath, &size);
    }
    const QString fileName = QFileInfo(localPath).fileName();

    if (!reason.isEmpty()) {
        errorHandler_->handleRejectedFile(fileName.isEmpty() ? localPath : fileName, reason);
        emit fileRejected(localPath, reason);
        return QString();
    }

    UploadFile file;
    file.sourcePath = localPath;
    file.displayName = fileName;
    file.declaredSize = size;
    file.destinationHint = destinationHint.isEmpty() ? settings_.destinationHint : destinationHint;

    QString id = queue_->submit(file);
    onStatusMessage(tr("Queued upload: %1").arg(fileName), 3000);
    return id;
}

QStringList UploadService::uploadFiles(const QStringList &localPaths, const QString &destinationHint)
{
    QStringList ids;
    for (const QString &path : localPaths) {
        QString id = uploadFile(path, destinationHint);
        if (!id.isEmpty()) {
            ids.append(id);
        }
    }
    return ids;
}

QString UploadService::validateFile(const QString &localPath, qint64 *size) const
{
    QFileInfo info(localPath);
    if (!info.exists() || !info.isFile()) {
        return tr("File does not exist");
    }
    if (!info.isReadable()) {
        return tr("File is not readable");
    }

    if (size) {
        *size = info.size();
    }

    if (settings_.maxFileSizeBytes > 0 && info.size() > settings_.maxFileSizeBytes) {
        return tr("File is larger than %1")
            .arg(QLocale::c().formattedDataSize(settings_.maxFileSizeBytes));
    }

    if (!settings_.acceptsSuffix(info.suffix())) {
        return tr("Unsupported file type, accepted: %1")
            .arg(settings_.acceptedSuffixes.join(", "));
    }

    return QString();
}

void UploadService::cancel(const QString &id)
{
    queue_->cancel(id);
}

void UploadService::retry(const QString &id)
{
    queue_->retry(id);
}

void UploadService::retryAll()
{
    queue_->retryAll();
}

void UploadService::clearCompleted()
{
    queue_->clearCompleted();
}

void UploadService::pauseAll()
{
    queue_->pauseAll();
    onStatusMessage(tr("Paused all uploads"), 3000);
}

void UploadService::resumeAll()
{
    queue_->resumeAll();
}

void UploadService::clear()
{
    queue_->clear();
}

UploadSnapshot UploadService::snapshot() const
{
    return queue_->snapshot();
}

bool UploadService::isBusy() const
{
    return queue_->snapshot().counts.pending() > 0;
}

void UploadService::onSnapshotChanged(const UploadSnapshot &snapshot)
{
    if (snapshot.allFailed) {
        if (!escalated_) {
            escalated_ = true;
            errorHandler_->handleAllUploadsFailed(snapshot.counts.failed);
        }
    } else {
        escalated_ = false;
    }

    if (presenter_) {
        presenter_->render(snapshot);
    }
    emit snapshotChanged(snapshot);
}

void UploadService::onUploadFailed(const QString &id, const UploadError &error)
{
    std::optional<UploadTask> task = queue_->task(id);
    errorHandler_->handleUploadFailed(task ? task->displayName : courier::shortId(id), error);
    emit uploadFailed(id, error);
}

void UploadService::onStatusMessage(const QString &message, int timeout)
{
    if (presenter_) {
        presenter_->showStatus(message, timeout);
    }
    emit statusMessage(message, timeout);
}

void UploadService::onBlockingError(const QString &title, const QString &details)
{
    if (presenter_) {
        presenter_->showBlockingError(title, details);
    }
    emit blockingErrorRaised(title, details);
}
