#include "retrypolicy.h"

#include <QStringList>

#include <algorithm>

namespace {

// Checked first: these describe requests that will fail the same way again
const QStringList kPermanentMarkers = {
    QStringLiteral("unauthorized"),
    QStringLiteral("forbidden"),
    QStringLiteral("authorization"),
    QStringLiteral("authentication"),
    QStringLiteral("token"),
    QStringLiteral("validation"),
    QStringLiteral("invalid"),
    QStringLiteral("unsupported"),
    QStringLiteral("too large"),
    QStringLiteral("size limit"),
    QStringLiteral("exceeds"),
    QStringLiteral("not found"),
    QStringLiteral("no such file"),
};

const QStringList kTransientMarkers = {
    QStringLiteral("timeout"),
    QStringLiteral("timed out"),
    QStringLiteral("network"),
    QStringLiteral("connection"),
    QStringLiteral("interrupted"),
    QStringLiteral("abort"),
    QStringLiteral("reset"),
    QStringLiteral("refused"),
    QStringLiteral("unreachable"),
    QStringLiteral("temporarily"),
    QStringLiteral("unavailable"),
    QStringLiteral("fail"),
};

bool containsAny(const QString &haystack, const QStringList &needles)
{
    return std::any_of(needles.cbegin(), needles.cend(), [&haystack](const QString &needle) {
        return haystack.contains(needle);
    });
}

} // namespace

RetryPolicy::RetryPolicy(int maxRetries, int baseDelayMs)
    : maxRetries_(std::max(0, maxRetries))
    , baseDelayMs_(std::max(0, baseDelayMs))
{
}

UploadError RetryPolicy::classify(const QString &message, int statusCode) const
{
    UploadError error;
    error.message = message;
    error.statusCode = statusCode;

    bool knownStatus = false;
    UploadErrorKind statusKind = kindForStatus(statusCode, &knownStatus);
    if (knownStatus) {
        error.kind = statusKind;
        return error;
    }

    const QString lowered = message.toLower();
    if (containsAny(lowered, kPermanentMarkers)) {
        error.kind = UploadErrorKind::Permanent;
    } else if (containsAny(lowered, kTransientMarkers)) {
        error.kind = UploadErrorKind::Transient;
    } else {
        error.kind = UploadErrorKind::Permanent;
    }
    return error;
}

bool RetryPolicy::isRetryable(const UploadError &error, int retryCount, int maxRetries) const
{
    return error.isTransient() && retryCount < maxRetries;
}

bool RetryPolicy::canRetry(const UploadTask &task) const
{
    return task.state == UploadState::Failed
        && task.retryable
        && task.retryCount < task.maxRetries;
}

int RetryPolicy::backoffDelayMs(int retryCount) const
{
    if (retryCount <= 0) {
        return 0;
    }
    return baseDelayMs_ * retryCount;
}

UploadErrorKind RetryPolicy::kindForStatus(int statusCode, bool *known)
{
    *known = true;
    switch (statusCode) {
    case 408:  // Request Timeout
    case 429:  // Too Many Requests
        return UploadErrorKind::Transient;
    case 400:
    case 401:
    case 403:
    case 404:
    case 413:  // Payload Too Large
    case 415:
    case 422:
        return UploadErrorKind::Permanent;
    default:
        break;
    }

    if (statusCode >= 500 && statusCode < 600) {
        return UploadErrorKind::Transient;
    }

    // 0 (no response) and unlisted codes fall back to the message text
    *known = false;
    return UploadErrorKind::Permanent;
}
