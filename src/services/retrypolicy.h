/**
 * @file retrypolicy.h
 * @brief Failure classification and retry eligibility for uploads.
 */

#ifndef RETRYPOLICY_H
#define RETRYPOLICY_H

#include <QString>

#include "models/uploaderror.h"
#include "models/uploadtask.h"

/**
 * @brief Decides whether a failed upload may be attempted again.
 *
 * Classification is a pure function of the error payload. Server statuses win
 * over message text; among message markers the permanent ones are checked
 * first so "validation failed" is not mistaken for a transient failure.
 * Anything unrecognised is treated as permanent.
 *
 * The policy never retries by itself. It answers questions for the queue
 * (is this task eligible?) and for callers that layer backoff on top
 * (how long should I wait?).
 */
class RetryPolicy
{
public:
    static constexpr int DefaultBaseDelayMs = 1000;

    explicit RetryPolicy(int maxRetries = UploadTask::DefaultMaxRetries,
                         int baseDelayMs = DefaultBaseDelayMs);

    [[nodiscard]] int maxRetries() const { return maxRetries_; }
    [[nodiscard]] int baseDelayMs() const { return baseDelayMs_; }

    /**
     * @brief Classifies a transfer failure.
     * @param message Error text reported by the transfer client.
     * @param statusCode HTTP status, or 0 for transport-level failures.
     * @return A Transient or Permanent error carrying the original payload.
     */
    [[nodiscard]] UploadError classify(const QString &message, int statusCode = 0) const;

    /**
     * @brief Whether a task that just failed with @p error stays retryable.
     *
     * False for permanent errors and once the retry budget is spent.
     */
    [[nodiscard]] bool isRetryable(const UploadError &error, int retryCount, int maxRetries) const;

    /**
     * @brief Whether retry() may be applied to @p task right now.
     */
    [[nodiscard]] bool canRetry(const UploadTask &task) const;

    /**
     * @brief Delay before the given retry (base x retryCount, 0 for retryCount <= 0).
     */
    [[nodiscard]] int backoffDelayMs(int retryCount) const;

private:
    [[nodiscard]] static UploadErrorKind kindForStatus(int statusCode, bool *known);

    int maxRetries_;
    int baseDelayMs_;
};

#endif // RETRYPOLICY_H
