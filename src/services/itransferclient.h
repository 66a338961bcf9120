/**
 * @file itransferclient.h
 * @brief Interface for transfer client implementations.
 *
 * This interface allows dependency injection of transfer clients, enabling
 * runtime swapping between the HTTP client and mock implementations for testing.
 */

#ifndef ITRANSFERCLIENT_H
#define ITRANSFERCLIENT_H

#include <QObject>
#include <QString>

/**
 * @brief One in-flight transfer attempt.
 *
 * A handle reports zero or more progressChanged() signals followed by exactly
 * one of succeeded() or failed(). Once abort() returns, the handle emits
 * nothing further. Handles never emit from inside ITransferClient::start().
 */
class TransferHandle : public QObject
{
    Q_OBJECT

public:
    explicit TransferHandle(QObject *parent = nullptr) : QObject(parent) {}
    ~TransferHandle() override = default;

    /**
     * @brief Aborts the transfer. Safe to call after completion.
     */
    virtual void abort() = 0;

signals:
    /**
     * @brief Emitted as bytes are sent.
     * @param percent Progress of this attempt, 0-100.
     * @param throughputEstimate Bytes per second (0 if the client has no estimate).
     */
    void progressChanged(int percent, double throughputEstimate);

    /**
     * @brief Emitted once when the remote endpoint accepted the file.
     * @param resultLocation Where the stored file can be fetched from.
     * @param elapsedMs Duration of the attempt.
     */
    void succeeded(const QString &resultLocation, qint64 elapsedMs);

    /**
     * @brief Emitted once when the attempt failed.
     * @param message Human-readable error description.
     * @param statusCode HTTP status if the server answered, otherwise 0.
     */
    void failed(const QString &message, int statusCode);
};

/**
 * @brief Abstract interface for transfer client implementations.
 *
 * @par Example usage:
 * @code
 * // Production code
 * ITransferClient *client = new HttpTransferClient(this);
 *
 * // Test code
 * ITransferClient *client = new MockTransferClient(this);
 *
 * UploadScheduler scheduler(queue, client);
 * @endcode
 */
class ITransferClient : public QObject
{
    Q_OBJECT

public:
    explicit ITransferClient(QObject *parent = nullptr) : QObject(parent) {}
    ~ITransferClient() override = default;

    /**
     * @brief Starts uploading a file.
     * @param sourcePath Local file to send.
     * @param destinationHint Client-specific destination (endpoint path, bucket key).
     * @return A new handle owned by the caller, or nullptr if the transfer
     *         could not be started at all.
     */
    [[nodiscard]] virtual TransferHandle* start(const QString &sourcePath,
                                                const QString &destinationHint) = 0;
};

#endif // ITRANSFERCLIENT_H
