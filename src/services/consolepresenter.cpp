#include "consolepresenter.h"

#include <QSet>

#include <cstdio>

ConsolePresenter::ConsolePresenter(QTextStream *out)
    : stdout_(stdout)
    , out_(out ? out : &stdout_)
{
}

void ConsolePresenter::render(const UploadSnapshot &snapshot)
{
    QSet<QString> present;
    for (const UploadTask &task : snapshot.tasks) {
        present.insert(task.id);

        if (!task.isTerminal()) {
            // A retried task may report again
            reported_.remove(task.id);
            continue;
        }
        auto it = reported_.constFind(task.id);
        if (it != reported_.cend() && it.value() == task.state) {
            continue;
        }
        reported_.insert(task.id, task.state);

        if (task.state == UploadState::Succeeded) {
            writeLine(QString("  done  %1 -> %2").arg(task.displayName, task.resultLocation));
        } else {
            QString line = QString("  FAIL  %1: %2").arg(task.displayName, task.lastError.message);
            if (task.retryable) {
                line += QString(" (retryable, %1/%2 retries used)").arg(task.retryCount).arg(task.maxRetries);
            }
            writeLine(line);
        }
    }

    // Forget tasks that were cancelled or cleared
    for (auto it = reported_.begin(); it != reported_.end();) {
        if (!present.contains(it.key())) {
            it = reported_.erase(it);
        } else {
            ++it;
        }
    }

    QString summary = summaryLine(snapshot);
    if (summary != lastSummary_) {
        lastSummary_ = summary;
        writeLine(summary);
    }
}

void ConsolePresenter::showStatus(const QString &message, int timeout)
{
    Q_UNUSED(timeout)
    writeLine(QString("  ** %1").arg(message));
}

void ConsolePresenter::showBlockingError(const QString &title, const QString &details)
{
    writeLine(QString("!! %1: %2").arg(title, details));
}

QString ConsolePresenter::summaryLine(const UploadSnapshot &snapshot)
{
    if (snapshot.isEmpty()) {
        return QStringLiteral("[idle] no uploads");
    }

    const UploadCounts &counts = snapshot.counts;
    QString line = QString("[%1%] %2 active, %3 waiting, %4 done, %5 failed")
        .arg(snapshot.overallProgress, 3)
        .arg(counts.active)
        .arg(counts.waiting)
        .arg(counts.succeeded)
        .arg(counts.failed);

    if (snapshot.averageThroughput > 0.0) {
        line += QString(" | %1").arg(formatRate(snapshot.averageThroughput));
    }
    if (snapshot.estimatedRemainingSeconds > 0) {
        line += QString(" | ETA %1").arg(formatDuration(snapshot.estimatedRemainingSeconds));
    }
    if (snapshot.paused) {
        line += QStringLiteral(" (paused)");
    }
    return line;
}

QString ConsolePresenter::formatBytes(qint64 bytes)
{
    constexpr qint64 KB = 1024;
    constexpr qint64 MB = KB * 1024;
    constexpr qint64 GB = MB * 1024;

    if (bytes < KB) {
        return QString("%1 B").arg(bytes);
    }
    if (bytes < MB) {
        return QString("%1 KB").arg(static_cast<double>(bytes) / KB, 0, 'f', 1);
    }
    if (bytes < GB) {
        return QString("%1 MB").arg(static_cast<double>(bytes) / MB, 0, 'f', 1);
    }
    return QString("%1 GB").arg(static_cast<double>(bytes) / GB, 0, 'f', 2);
}

QString ConsolePresenter::formatRate(double bytesPerSecond)
{
    return QString("%1/s").arg(formatBytes(static_cast<qint64>(bytesPerSecond)));
}

QString ConsolePresenter::formatDuration(qint64 seconds)
{
    if (seconds < 60) {
        return QString("%1s").arg(seconds);
    }
    if (seconds < 3600) {
        return QString("%1m %2s").arg(seconds / 60).arg(seconds % 60, 2, 10, QChar('0'));
    }
    return QString("%1h %2m").arg(seconds / 3600).arg((seconds % 3600) / 60, 2, 10, QChar('0'));
}

void ConsolePresenter::writeLine(const QString &line)
{
    *out_ << line << Qt::endl;
}
