/**
 * @file uploadsettings.h
 * @brief Persistent configuration of the upload pipeline.
 */

#ifndef UPLOADSETTINGS_H
#define UPLOADSETTINGS_H

#include <QString>
#include <QStringList>

class QSettings;

/**
 * @brief Upload configuration stored under the "upload/" group of QSettings.
 *
 * Values read from disk are normalized: limits below their minimum are
 * clamped and suffixes are lower-cased without leading dots.
 *
 * @par Example usage:
 * @code
 * QSettings settings;
 * UploadSettings config = UploadSettings::load(settings);
 * config.activeLimit = 5;
 * config.save(settings);
 * @endcode
 */
struct UploadSettings {
    static constexpr int DefaultActiveLimit = 3;
    static constexpr int DefaultMaxRetries = 3;
    static constexpr qint64 DefaultDeclaredSize = 1024 * 1024;
    static constexpr qint64 DefaultMaxFileSize = 10 * 1024 * 1024;
    static constexpr int DefaultMaxFileCount = 9;
    static constexpr int DefaultRetryBaseDelayMs = 1000;
    static constexpr int DefaultTransferTimeoutMs = 60000;

    int activeLimit = DefaultActiveLimit;
    int maxRetries = DefaultMaxRetries;
    qint64 defaultDeclaredSize = DefaultDeclaredSize;
    qint64 maxFileSizeBytes = DefaultMaxFileSize;  // 0 = unlimited
    int maxFileCount = DefaultMaxFileCount;  // Tasks per session, 0 = unlimited
    QStringList acceptedSuffixes = defaultAcceptedSuffixes();  // Empty = accept all
    bool autoRetry = false;
    int retryBaseDelayMs = DefaultRetryBaseDelayMs;
    int transferTimeoutMs = DefaultTransferTimeoutMs;
    QString endpoint;
    QString destinationHint;
    QString authToken;  // Not persisted; supplied by the session layer

    [[nodiscard]] static QStringList defaultAcceptedSuffixes();

    [[nodiscard]] static UploadSettings load(QSettings &settings);
    void save(QSettings &settings) const;

    /// Returns a copy with every value clamped into its valid range.
    [[nodiscard]] UploadSettings normalized() const;

    /// Whether @p suffix (case-insensitive, no dot) is accepted.
    [[nodiscard]] bool acceptsSuffix(const QString &suffix) const;
};

#endif // UPLOADSETTINGS_H
