#include "httptransferclient.h"
#include "utils/logging.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QHttpMultiPart>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>

#include <algorithm>

// === HttpTransferHandle ===

HttpTransferHandle::HttpTransferHandle(QNetworkReply *reply, QObject *parent)
    : TransferHandle(parent)
    , reply_(reply)
{
    timer_.start();
    connect(reply_, &QNetworkReply::uploadProgress,
            this, &HttpTransferHandle::onUploadProgress);
    connect(reply_, &QNetworkReply::finished,
            this, &HttpTransferHandle::onFinished);
}

HttpTransferHandle::~HttpTransferHandle()
{
    if (reply_) {
        disconnect(reply_, nullptr, this, nullptr);
        if (!finished_) {
            reply_->abort();
        }
        reply_->deleteLater();
    }
}

void HttpTransferHandle::abort()
{
    if (finished_) {
        return;
    }
    // Mark first: QNetworkReply::abort() emits finished() synchronously
    finished_ = true;
    if (reply_) {
        reply_->abort();
    }
}

void HttpTransferHandle::onUploadProgress(qint64 bytesSent, qint64 bytesTotal)
{
    if (finished_ || bytesTotal <= 0) {
        return;
    }

    int percent = static_cast<int>(std::clamp<qint64>(bytesSent * 100 / bytesTotal, 0, 100));
    qint64 elapsed = std::max<qint64>(1, timer_.elapsed());
    double throughput = static_cast<double>(bytesSent) * 1000.0 / static_cast<double>(elapsed);

    if (percent != lastPercent_) {
        lastPercent_ = percent;
        emit progressChanged(percent, throughput);
    }
}

void HttpTransferHandle::onFinished()
{
    if (finished_ || !reply_) {
        return;
    }
    finished_ = true;

    const qint64 elapsedMs = timer_.elapsed();
    const int status = reply_->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray body = reply_->readAll();

    if (reply_->error() == QNetworkReply::OperationCanceledError) {
        // Not our abort (finished_ was false), so the transfer timeout fired
        emit failed(tr("Upload timed out"), 0);
        return;
    }

    if (reply_->error() != QNetworkReply::NoError) {
        // Prefer the server's own message; error pages that are not JSON fall back to Qt's text
        UploadResponse response = HttpTransferClient::parseResponse(body);
        QString message = response.valid && !response.message.isEmpty()
            ? response.message
            : reply_->errorString();
        emit failed(message, status);
        return;
    }

    UploadResponse response = HttpTransferClient::parseResponse(body);
    if (!response.ok) {
        emit failed(response.message.isEmpty() ? tr("Upload failed") : response.message, status);
        return;
    }

    emit succeeded(response.location, elapsedMs);
}

// === HttpTransferClient ===

HttpTransferClient::HttpTransferClient(QObject *parent)
    : ITransferClient(parent)
    , networkManager_(new QNetworkAccessManager(this))
{
}

HttpTransferClient::~HttpTransferClient() = default;

void HttpTransferClient::setEndpoint(const QUrl &endpoint)
{
    endpoint_ = endpoint;
    // Relative hints resolve under the endpoint only if its path ends with '/'
    QString path = endpoint_.path();
    if (!path.endsWith('/')) {
        endpoint_.setPath(path + '/');
    }
}

QUrl HttpTransferClient::resolveUrl(const QString &destinationHint) const
{
    QString hint = destinationHint.trimmed();
    while (hint.startsWith('/')) {
        hint.remove(0, 1);
    }
    if (hint.isEmpty()) {
        return endpoint_;
    }
    return endpoint_.resolved(QUrl(hint));
}

TransferHandle* HttpTransferClient::start(const QString &sourcePath, const QString &destinationHint)
{
    if (!endpoint_.isValid() || endpoint_.host().isEmpty()) {
        qWarning() << "HttpTransferClient: No endpoint configured";
        return nullptr;
    }

    const QString fileName = QFileInfo(sourcePath).fileName();
    auto *multiPart = new QHttpMultiPart(QHttpMultiPart::FormDataType);

    auto *file = new QFile(sourcePath, multiPart);
    if (!file->open(QIODevice::ReadOnly)) {
        qWarning() << "HttpTransferClient: Cannot open" << sourcePath << file->errorString();
        delete multiPart;
        return nullptr;
    }

    QHttpPart namePart;
    namePart.setHeader(QNetworkRequest::ContentDispositionHeader,
                       QVariant(QStringLiteral("form-data; name=\"fileName\"")));
    namePart.setBody(fileName.toUtf8());
    multiPart->append(namePart);

    QHttpPart filePart;
    filePart.setHeader(QNetworkRequest::ContentTypeHeader,
                       QVariant(QStringLiteral("application/octet-stream")));
    filePart.setHeader(QNetworkRequest::ContentDispositionHeader,
                       QVariant(fileDisposition(fileName)));
    filePart.setBodyDevice(file);
    multiPart->append(filePart);

    QNetworkRequest request(resolveUrl(destinationHint));
    if (!authToken_.isEmpty()) {
        request.setRawHeader("Authorization", QByteArray("Bearer ") + authToken_.toUtf8());
    }
    request.setTransferTimeout(transferTimeoutMs_);

    QNetworkReply *reply = networkManager_->post(request, multiPart);
    multiPart->setParent(reply);

    LOG_VERBOSE() << "HttpTransferClient: POST" << request.url().toString() << fileName;
    return new HttpTransferHandle(reply);
}

QString HttpTransferClient::fileDisposition(const QString &fileName)
{
    QString quoted;
    quoted.reserve(fileName.size());
    for (QChar c : fileName) {
        if (c == '\r' || c == '\n') {
            continue;
        }
        if (c == '"' || c == '\\') {
            quoted.append('\\');
        }
        quoted.append(c);
    }
    return QStringLiteral("form-data; name=\"file\"; filename=\"%1\"").arg(quoted);
}

UploadResponse HttpTransferClient::parseResponse(const QByteArray &body)
{
    UploadResponse response;

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        response.message = QObject::tr("Invalid response from server");
        return response;
    }

    response.valid = true;
    QJsonObject obj = doc.object();
    int code = obj.value("code").toInt(-1);
    if (code != 0) {
        response.message = obj.value("msg").toString();
        if (response.message.isEmpty()) {
            response.message = obj.value("message").toString();
        }
        return response;
    }

    QJsonValue data = obj.value("data");
    if (data.isString()) {
        response.location = data.toString();
    } else if (data.isObject()) {
        QJsonObject dataObj = data.toObject();
        response.location = dataObj.value("url").toString();
        if (response.location.isEmpty()) {
            response.location = dataObj.value("fileID").toString();
        }
    }

    response.ok = !response.location.isEmpty();
    if (!response.ok) {
        response.message = QObject::tr("Server response did not include a file location");
    }
    return response;
}
