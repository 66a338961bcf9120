/**
 * @file uploadpresenter.h
 * @brief Abstract interface for rendering upload queue state.
 *
 * Presenters receive an aggregate snapshot after every queue mutation and
 * issue commands back through the UploadService they are attached to.
 */

#ifndef UPLOADPRESENTER_H
#define UPLOADPRESENTER_H

#include <QString>

#include "models/uploadsnapshot.h"

class UploadService;

/**
 * @brief Abstract interface for upload presenters.
 *
 * Implementations must not assume snapshots are batched: one user command
 * can produce several snapshots (the command itself plus each admission it
 * triggers). Commands issued from inside render() are allowed.
 */
class UploadPresenter
{
public:
    virtual ~UploadPresenter() = default;

    /**
     * @brief Renders the aggregate state.
     * @param snapshot Tasks, overall progress, throughput, ETA and counts.
     */
    virtual void render(const UploadSnapshot &snapshot) = 0;

    /**
     * @brief Shows a transient status line (inline failures, rejected files).
     * @param message The message text.
     * @param timeout Display timeout in milliseconds (0 for sticky).
     */
    virtual void showStatus(const QString &message, int timeout) = 0;

    /**
     * @brief Shows a blocking indicator; raised when every upload failed.
     */
    virtual void showBlockingError(const QString &title, const QString &details) = 0;

    /**
     * @brief Called by UploadService when the presenter is attached or detached.
     * @param service The command sink, or nullptr on detach.
     */
    virtual void setCommandSink(UploadService *service) { commands_ = service; }

protected:
    [[nodiscard]] UploadService* commands() const { return commands_; }

private:
    UploadService *commands_ = nullptr;
};

#endif // UPLOADPRESENTER_H
