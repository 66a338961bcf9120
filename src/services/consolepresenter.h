/**
 * @file consolepresenter.h
 * @brief Text presenter printing upload progress to a terminal.
 */

#ifndef CONSOLEPRESENTER_H
#define CONSOLEPRESENTER_H

#include <QHash>
#include <QString>
#include <QTextStream>

#include "uploadpresenter.h"

/**
 * @brief Renders snapshots as one summary line per change.
 *
 * Besides the summary line, a line is printed whenever a task reaches a
 * terminal state, so the session log lists every file's outcome once.
 * Identical consecutive summary lines are suppressed.
 */
class ConsolePresenter : public UploadPresenter
{
public:
    /**
     * @brief Constructs a presenter.
     * @param out Stream to write to (not owned); stdout when nullptr.
     */
    explicit ConsolePresenter(QTextStream *out = nullptr);
    ~ConsolePresenter() override = default;

    void render(const UploadSnapshot &snapshot) override;
    void showStatus(const QString &message, int timeout) override;
    void showBlockingError(const QString &title, const QString &details) override;

    /// Last summary line printed, empty before the first render.
    [[nodiscard]] QString lastSummary() const { return lastSummary_; }

    [[nodiscard]] static QString summaryLine(const UploadSnapshot &snapshot);
    [[nodiscard]] static QString formatBytes(qint64 bytes);
    [[nodiscard]] static QString formatRate(double bytesPerSecond);
    [[nodiscard]] static QString formatDuration(qint64 seconds);

private:
    void writeLine(const QString &line);

    QTextStream stdout_;
    QTextStream *out_;
    QString lastSummary_;
    QHash<QString, UploadState> reported_;  // Terminal state already printed per task
};

#endif // CONSOLEPRESENTER_H
