#include "errorhandler.h"

#include <QDebug>

ErrorHandler::ErrorHandler(QObject *parent)
    : QObject(parent)
{
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    logError(category, severity, title, details);

    QString message = title;
    if (!details.isEmpty() && details != title) {
        message = QString("%1: %2").arg(title, details);
    }

    // Always show in the status line
    emit statusMessage(message, timeoutForSeverity(severity));

    if (severity == ErrorSeverity::Critical) {
        emit blockingErrorRaised(title, details.isEmpty() ? title : details);
    }
}

void ErrorHandler::handleUploadFailed(const QString &fileName, const UploadError &error)
{
    QString details = error.message;
    if (error.statusCode > 0) {
        details = tr("%1 (HTTP %2)").arg(error.message).arg(error.statusCode);
    }
    if (error.isTransient()) {
        details += tr(" - can be retried");
    }

    handleError(ErrorCategory::Transfer,
                ErrorSeverity::Warning,
                tr("Upload of %1 failed").arg(fileName),
                details);
}

void ErrorHandler::handleAllUploadsFailed(int failedCount)
{
    handleError(ErrorCategory::Transfer,
                ErrorSeverity::Critical,
                tr("All uploads failed"),
                tr("None of the %n file(s) could be uploaded", nullptr, failedCount));
}

void ErrorHandler::handleRejectedFile(const QString &fileName, const QString &reason)
{
    handleError(ErrorCategory::Validation,
                ErrorSeverity::Warning,
                tr("%1 was not queued").arg(fileName),
                reason);
}

void ErrorHandler::handleConfigurationError(const QString &message)
{
    handleError(ErrorCategory::Configuration,
                ErrorSeverity::Critical,
                tr("Configuration Error"),
                message);
}

void ErrorHandler::logError(ErrorCategory category,
                            ErrorSeverity severity,
                            const QString &title,
                            const QString &details)
{
    QString logMessage = QString("[%1/%2] %3")
        .arg(categoryToString(category),
             severityToString(severity),
             title);

    if (!details.isEmpty() && details != title) {
        logMessage += QString(": %1").arg(details);
    }

    switch (severity) {
    case ErrorSeverity::Info:
        qInfo().noquote() << logMessage;
        break;
    case ErrorSeverity::Warning:
        qWarning().noquote() << logMessage;
        break;
    case ErrorSeverity::Critical:
        qCritical().noquote() << logMessage;
        break;
    }

    emit errorLogged(category, severity, title, details);
}

int ErrorHandler::timeoutForSeverity(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return 3000;
    case ErrorSeverity::Warning:
        return 5000;
    case ErrorSeverity::Critical:
        return 0;     // Sticky until replaced
    }
    return 5000;
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Transfer:
        return QStringLiteral("Transfer");
    case ErrorCategory::Validation:
        return QStringLiteral("Validation");
    case ErrorCategory::Configuration:
        return QStringLiteral("Config");
    }
    return QStringLiteral("Unknown");
}

QString ErrorHandler::severityToString(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return QStringLiteral("INFO");
    case ErrorSeverity::Warning:
        return QStringLiteral("WARN");
    case ErrorSeverity::Critical:
        return QStringLiteral("CRIT");
    }
    return QStringLiteral("UNKNOWN");
}
