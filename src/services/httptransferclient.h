/**
 * @file httptransferclient.h
 * @brief Multipart HTTP upload client built on QNetworkAccessManager.
 */

#ifndef HTTPTRANSFERCLIENT_H
#define HTTPTRANSFERCLIENT_H

#include <QByteArray>
#include <QElapsedTimer>
#include <QPointer>
#include <QString>
#include <QUrl>

#include "itransferclient.h"

class QNetworkAccessManager;
class QNetworkReply;

/**
 * @brief Result of parsing the storage endpoint's JSON response.
 */
struct UploadResponse {
    bool valid = false;  // Body was a JSON object
    bool ok = false;
    QString location;  // URL of the stored file on success
    QString message;   // Server message on failure
};

/**
 * @brief Transfer handle wrapping one QNetworkReply.
 *
 * Throughput is derived from bytes sent over elapsed time since the request
 * was issued. An aborted handle swallows the reply's finished() signal.
 */
class HttpTransferHandle : public TransferHandle
{
    Q_OBJECT

public:
    explicit HttpTransferHandle(QNetworkReply *reply, QObject *parent = nullptr);
    ~HttpTransferHandle() override;

    void abort() override;

    [[nodiscard]] bool isFinished() const { return finished_; }

private slots:
    void onUploadProgress(qint64 bytesSent, qint64 bytesTotal);
    void onFinished();

private:
    QPointer<QNetworkReply> reply_;
    QElapsedTimer timer_;
    bool finished_ = false;
    int lastPercent_ = -1;
};

/**
 * @brief Uploads files as multipart/form-data POST requests.
 *
 * The destination hint is resolved against the configured endpoint, so a
 * hint of "submissions/42/images" posts to <endpoint>/submissions/42/images.
 * The file goes in a part named "file" with a "fileName" form field next to
 * it. A bearer token is sent when set.
 *
 * The server answers {"code": 0, "data": <url>} on success; any other code,
 * a non-2xx status or a transport error fails the attempt.
 *
 * @par Example usage:
 * @code
 * HttpTransferClient *client = new HttpTransferClient(this);
 * client->setEndpoint(QUrl("https://api.example.com/api/v1/"));
 * client->setAuthToken(session->token());
 * client->setTransferTimeout(60000);
 * @endcode
 */
class HttpTransferClient : public ITransferClient
{
    Q_OBJECT

public:
    explicit HttpTransferClient(QObject *parent = nullptr);
    ~HttpTransferClient() override;

    void setEndpoint(const QUrl &endpoint);
    [[nodiscard]] QUrl endpoint() const { return endpoint_; }

    void setAuthToken(const QString &token) { authToken_ = token; }

    /// Per-attempt timeout in ms; 0 disables it.
    void setTransferTimeout(int timeoutMs) { transferTimeoutMs_ = timeoutMs; }
    [[nodiscard]] int transferTimeout() const { return transferTimeoutMs_; }

    [[nodiscard]] TransferHandle* start(const QString &sourcePath,
                                        const QString &destinationHint) override;

    /// Resolves the destination hint against the endpoint.
    [[nodiscard]] QUrl resolveUrl(const QString &destinationHint) const;

    /// Parses the endpoint's JSON body.
    [[nodiscard]] static UploadResponse parseResponse(const QByteArray &body);

    /// Content-Disposition of the file part, with the file name quoted safely.
    [[nodiscard]] static QString fileDisposition(const QString &fileName);

private:
    QNetworkAccessManager *networkManager_ = nullptr;
    QUrl endpoint_;
    QString authToken_;
    int transferTimeoutMs_ = 60000;
};

#endif // HTTPTRANSFERCLIENT_H
