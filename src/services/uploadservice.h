/**
 * @file uploadservice.h
 * @brief Service coordinating the upload queue, validation and presentation.
 *
 * This service encapsulates the upload workflow, providing one command
 * surface and high-level signals for presenters instead of direct
 * UploadQueue coupling.
 */

#ifndef UPLOADSERVICE_H
#define UPLOADSERVICE_H

#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>

#include "models/uploadqueue.h"
#include "services/uploadsettings.h"

class ErrorHandler;
class UploadPresenter;

/**
 * @brief Service for coordinating upload operations.
 *
 * UploadService provides the command surface a presenter talks to:
 * - Files are validated (existence, size limit, accepted types) before they
 *   reach the queue; rejected files are never queued
 * - Queue signals are forwarded and each snapshot is rendered by the
 *   attached presenter
 * - Failures are routed through ErrorHandler: one failure is inline, total
 *   failure raises a blocking indicator once until the state changes
 *
 * @par Example usage:
 * @code
 * UploadQueue *queue = new UploadQueue(this);
 * UploadScheduler *scheduler = new UploadScheduler(queue, client, this);
 * UploadService *service = new UploadService(queue, this);
 *
 * service->applySettings(UploadSettings::load(settings));
 * service->setPresenter(&consolePresenter);
 * service->uploadFile("/tmp/photo.jpg");
 * @endcode
 */
class UploadService : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs an upload service.
     * @param queue The upload queue to delegate to (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit UploadService(UploadQueue *queue, QObject *parent = nullptr);
    ~UploadService() override;

    /// @name Configuration
    /// @{

    /**
     * @brief Applies limits, retry policy and validation rules.
     *
     * The queue's active limit and default size take effect immediately;
     * the retry budget applies to files submitted afterwards.
     */
    void applySettings(const UploadSettings &settings);
    [[nodiscard]] UploadSettings settings() const { return settings_; }

    /**
     * @brief Attaches the presenter that renders snapshots (not owned).
     * @param presenter The presenter, or nullptr to detach.
     *
     * The presenter must outlive the service or be detached first; the
     * destructor clears its command sink.
     */
    void setPresenter(UploadPresenter *presenter);
    /// @}

    /// @name Submission
    /// @{

    /**
     * @brief Validates and queues a single file.
     *
     * Refused without looking at the file once the queue already holds
     * maxFileCount tasks.
     *
     * @param localPath Path to the local file.
     * @param destinationHint Overrides the configured destination if not empty.
     * @return The task id, or an empty string if the file was rejected.
     */
    QString uploadFile(const QString &localPath, const QString &destinationHint = QString());

    /**
     * @brief Queues several files; rejected ones are skipped.
     * @return Ids of the files that were queued.
     */
    QStringList uploadFiles(const QStringList &localPaths, const QString &destinationHint = QString());

    /**
     * @brief Checks a file against the validation rules.
     * @param localPath Path to check.
     * @param size Receives the file size when the file exists (may be nullptr).
     * @return Empty if acceptable, otherwise a human-readable reason.
     */
    [[nodiscard]] QString validateFile(const QString &localPath, qint64 *size = nullptr) const;
    /// @}

    /// @name Queue Commands
    /// @{
    void cancel(const QString &id);
    void retry(const QString &id);
    void retryAll();
    void clearCompleted();
    void pauseAll();
    void resumeAll();
    void clear();
    /// @}

    /// @name Queue State
    /// @{
    [[nodiscard]] UploadSnapshot snapshot() const;
    [[nodiscard]] bool isBusy() const;
    [[nodiscard]] UploadQueue* queue() const { return queue_; }
    [[nodiscard]] ErrorHandler* errorHandler() const { return errorHandler_; }
    /// @}

signals:
    void snapshotChanged(const UploadSnapshot &snapshot);
    void uploadStarted(const QString &id);
    void uploadSucceeded(const QString &id, const QString &resultLocation);
    void uploadFailed(const QString &id, const UploadError &error);
    void uploadCancelled(const QString &id);
    void allUploadsFinished();

    /// A file did not pass validation and was not queued.
    void fileRejected(const QString &localPath, const QString &reason);

    void statusMessage(const QString &message, int timeout = 0);
    void blockingErrorRaised(const QString &title, const QString &details);

private slots:
    void onSnapshotChanged(const UploadSnapshot &snapshot);
    void onUploadFailed(const QString &id, const UploadError &error);
    void onStatusMessage(const QString &message, int timeout);
    void onBlockingError(const QString &title, const QString &details);

private:
    QPointer<UploadQueue> queue_;
    ErrorHandler *errorHandler_ = nullptr;
    UploadPresenter *presenter_ = nullptr;
    UploadSettings settings_;
    bool escalated_ = false;  // Blocking indicator raised for the current all-failed state
};

#endif // UPLOADSERVICE_H
