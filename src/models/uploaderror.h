/**
 * @file uploaderror.h
 * @brief Classified upload failure carried as task state.
 */

#ifndef UPLOADERROR_H
#define UPLOADERROR_H

#include <QMetaType>
#include <QString>

/**
 * @brief Failure taxonomy for upload attempts.
 */
enum class UploadErrorKind {
    Transient,  ///< Network, timeout or transport abort - may be retried
    Permanent,  ///< Validation, authorization or size limit - never retried
    Cancelled   ///< User initiated; the task is removed rather than failed
};

[[nodiscard]] inline const char* uploadErrorKindToString(UploadErrorKind kind) {
    switch (kind) {
        case UploadErrorKind::Transient: return "Transient";
        case UploadErrorKind::Permanent: return "Permanent";
        case UploadErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

struct UploadError {
    UploadErrorKind kind = UploadErrorKind::Permanent;
    QString message;
    int statusCode = 0;  // HTTP status when the server answered, 0 for transport errors

    [[nodiscard]] bool isTransient() const { return kind == UploadErrorKind::Transient; }
    [[nodiscard]] bool isNull() const { return message.isEmpty() && statusCode == 0; }
};

Q_DECLARE_METATYPE(UploadError)

#endif // UPLOADERROR_H
