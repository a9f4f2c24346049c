#ifndef TRANSFERJOB_H
#define TRANSFERJOB_H

#include <QDateTime>
#include <QString>

#include <optional>

enum class TransferKind { Download, Upload };

/// @brief Convert TransferKind to string for logging
[[nodiscard]] inline const char* transferKindToString(TransferKind kind) {
    switch (kind) {
        case TransferKind::Download: return "Download";
        case TransferKind::Upload: return "Upload";
    }
    return "Unknown";
}

/**
 * @brief A single requested transfer: one file or one folder tree.
 *
 * Downloads go remote sourcePath -> local destPath, uploads go local
 * sourcePath -> remote destPath. The id stays stable for the job's
 * lifetime so events can be correlated with it.
 */
struct TransferJob {
    quint64 id = 0;
    TransferKind kind = TransferKind::Download;
    QString fileName;      ///< Display name (file or folder name)
    QString sourcePath;
    QString destPath;
    std::optional<quint64> expectedTotalBytes;  ///< Unknown when the size probe failed
    bool isDirectory = false;

    /// @brief Single-file downloads are the only jobs subject to the parallel cap.
    [[nodiscard]] bool isSingleFileDownload() const
    {
        return kind == TransferKind::Download && !isDirectory;
    }

    /// @brief The local end of the transfer.
    [[nodiscard]] QString localPath() const
    {
        return kind == TransferKind::Download ? destPath : sourcePath;
    }
};

/**
 * @brief A job a worker is currently executing. Owned by ProgressAggregator.
 */
struct ActiveTransfer {
    TransferJob job;
    quint64 bytesDone = 0;
    QDateTime startedAt;
};

/**
 * @brief Message from a worker to the aggregator.
 *
 * A Progress event carries partial counts for a job, a Completed event its
 * final result. Events from one job arrive in the order they were sent.
 */
struct ProgressEvent {
    enum class Type { Progress, Completed };

    Type type = Type::Progress;
    quint64 jobId = 0;
    TransferKind kind = TransferKind::Download;

    // Progress
    QString label;
    int filesDone = 0;
    int filesTotal = 0;
    quint64 bytesDone = 0;
    quint64 bytesTotal = 0;

    // Completed
    QString fileName;
    QString localPath;
    bool ok = false;
    QString errorMessage;

    [[nodiscard]] bool isCompleted() const { return type == Type::Completed; }

    [[nodiscard]] static ProgressEvent progress(const TransferJob &job, const QString &label,
                                                int filesDone, int filesTotal,
                                                quint64 bytesDone, quint64 bytesTotal)
    {
        ProgressEvent event;
        event.type = Type::Progress;
        event.jobId = job.id;
        event.kind = job.kind;
        event.label = label;
        event.filesDone = filesDone;
        event.filesTotal = filesTotal;
        event.bytesDone = bytesDone;
        event.bytesTotal = bytesTotal;
        return event;
    }

    [[nodiscard]] static ProgressEvent succeeded(const TransferJob &job)
    {
        ProgressEvent event;
        event.type = Type::Completed;
        event.jobId = job.id;
        event.kind = job.kind;
        event.fileName = job.fileName;
        event.localPath = job.localPath();
        event.ok = true;
        return event;
    }

    [[nodiscard]] static ProgressEvent failed(const TransferJob &job, const QString &errorMessage)
    {
        ProgressEvent event = succeeded(job);
        event.ok = false;
        event.errorMessage = errorMessage;
        return event;
    }
};

#endif // TRANSFERJOB_H
