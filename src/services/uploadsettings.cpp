#include "uploadsettings.h"

#include <QSettings>

#include <algorithm>

QStringList UploadSettings::defaultAcceptedSuffixes()
{
    return {QStringLiteral("jpg"), QStringLiteral("jpeg"), QStringLiteral("png"),
            QStringLiteral("webp"), QStringLiteral("pdf")};
}

UploadSettings UploadSettings::load(QSettings &settings)
{
    UploadSettings defaults;
    UploadSettings result;

    result.activeLimit = settings.value("upload/activeLimit", defaults.activeLimit).toInt();
    result.maxRetries = settings.value("upload/maxRetries", defaults.maxRetries).toInt();
    result.defaultDeclaredSize = settings.value("upload/defaultDeclaredSize", defaults.defaultDeclaredSize).toLongLong();
    result.maxFileSizeBytes = settings.value("upload/maxFileSizeBytes", defaults.maxFileSizeBytes).toLongLong();
    result.maxFileCount = settings.value("upload/maxFileCount", defaults.maxFileCount).toInt();
    result.acceptedSuffixes = settings.value("upload/acceptedSuffixes", defaults.acceptedSuffixes).toStringList();
    result.autoRetry = settings.value("upload/autoRetry", defaults.autoRetry).toBool();
    result.retryBaseDelayMs = settings.value("upload/retryBaseDelayMs", defaults.retryBaseDelayMs).toInt();
    result.transferTimeoutMs = settings.value("upload/transferTimeoutMs", defaults.transferTimeoutMs).toInt();
    result.endpoint = settings.value("upload/endpoint").toString();
    result.destinationHint = settings.value("upload/destinationHint").toString();

    return result.normalized();
}

void UploadSettings::save(QSettings &settings) const
{
    settings.setValue("upload/activeLimit", activeLimit);
    settings.setValue("upload/maxRetries", maxRetries);
    settings.setValue("upload/defaultDeclaredSize", defaultDeclaredSize);
    settings.setValue("upload/maxFileSizeBytes", maxFileSizeBytes);
    settings.setValue("upload/maxFileCount", maxFileCount);
    settings.setValue("upload/acceptedSuffixes", acceptedSuffixes);
    settings.setValue("upload/autoRetry", autoRetry);
    settings.setValue("upload/retryBaseDelayMs", retryBaseDelayMs);
    settings.setValue("upload/transferTimeoutMs", transferTimeoutMs);
    settings.setValue("upload/endpoint", endpoint);
    settings.setValue("upload/destinationHint", destinationHint);
}

UploadSettings UploadSettings::normalized() const
{
    UploadSettings result = *this;
    result.activeLimit = std::max(1, activeLimit);
    result.maxRetries = std::max(0, maxRetries);
    result.defaultDeclaredSize = std::max<qint64>(0, defaultDeclaredSize);
    result.maxFileSizeBytes = std::max<qint64>(0, maxFileSizeBytes);
    result.maxFileCount = std::max(0, maxFileCount);
    result.retryBaseDelayMs = std::max(0, retryBaseDelayMs);
    // Qt treats 0 as "no timeout"; keep that meaning, reject negatives
    result.transferTimeoutMs = std::max(0, transferTimeoutMs);

    result.acceptedSuffixes.clear();
    for (QString suffix : acceptedSuffixes) {
        suffix = suffix.trimmed().toLower();
        while (suffix.startsWith('.')) {
            suffix.remove(0, 1);
        }
        if (!suffix.isEmpty() && !result.acceptedSuffixes.contains(suffix)) {
            result.acceptedSuffixes.append(suffix);
        }
    }
    return result;
}

bool UploadSettings::acceptsSuffix(const QString &suffix) const
{
    if (acceptedSuffixes.isEmpty()) {
        return true;
    }
    return acceptedSuffixes.contains(suffix.toLower());
}
