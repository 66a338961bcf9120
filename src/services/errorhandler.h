/**
 * @file errorhandler.h
 * @brief Centralized error reporting for the upload pipeline.
 *
 * This service standardizes how upload failures and rejected files are
 * categorized, logged and surfaced, so presenters render failures without
 * special control flow.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>

#include "models/uploaderror.h"

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Transfer,       ///< A file failed to upload
    Validation,     ///< A file was rejected before it was queued
    Configuration   ///< Missing endpoint, unreadable settings
};

/**
 * @brief Severity levels determining how errors are displayed.
 */
enum class ErrorSeverity {
    Info,      ///< Informational - status line only, short timeout
    Warning,   ///< Inline - status line, longer timeout, siblings keep going
    Critical   ///< Blocking - status line plus blocking indicator
};

/**
 * @brief Centralized error handling service.
 *
 * ErrorHandler provides consistent error presentation:
 * - A single failed upload is reported inline (Warning)
 * - Total failure of every submitted upload escalates to a blocking indicator (Critical)
 * - Everything is logged with category and severity
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 * connect(handler, &ErrorHandler::statusMessage, presenter, &Presenter::showStatus);
 * connect(handler, &ErrorHandler::blockingErrorRaised, presenter, &Presenter::showBlocking);
 *
 * handler->handleUploadFailed("photo.jpg", error);
 * handler->handleAllUploadsFailed(3);
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    explicit ErrorHandler(QObject *parent = nullptr);
    ~ErrorHandler() override = default;

    /**
     * @brief Handles an error with specified category and severity.
     * @param category The error category.
     * @param severity The error severity.
     * @param title Short error title/summary.
     * @param details Detailed error message.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());

    /// @name Convenience Methods for Common Error Sources
    /// @{

    /**
     * @brief Reports one failed upload inline.
     * @param fileName Display name of the file.
     * @param error The classified failure.
     */
    void handleUploadFailed(const QString &fileName, const UploadError &error);

    /**
     * @brief Escalates when every submitted upload has failed.
     * @param failedCount Number of failed uploads.
     */
    void handleAllUploadsFailed(int failedCount);

    /**
     * @brief Reports a file rejected before submission.
     * @param fileName The rejected file.
     * @param reason Why it was rejected.
     */
    void handleRejectedFile(const QString &fileName, const QString &reason);

    /**
     * @brief Reports a configuration problem (critical severity).
     */
    void handleConfigurationError(const QString &message);
    /// @}

    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);
    [[nodiscard]] static QString categoryToString(ErrorCategory category);
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);

signals:
    /**
     * @brief Emitted to display a status line message.
     * @param message The message text.
     * @param timeout Display timeout in milliseconds (0 for no timeout).
     */
    void statusMessage(const QString &message, int timeout);

    /**
     * @brief Emitted for critical errors that should block the presenter.
     */
    void blockingErrorRaised(const QString &title, const QString &details);

    /**
     * @brief Emitted when an error is logged (for debugging/monitoring).
     */
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);
};

#endif // ERRORHANDLER_H
