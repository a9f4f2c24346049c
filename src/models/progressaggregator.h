#ifndef PROGRESSAGGREGATOR_H
#define PROGRESSAGGREGATOR_H

#include <QHash>
#include <QList>
#include <QObject>
#include <QSet>
#include <QString>

#include <memory>
#include <optional>

#include "panelstate.h"
#include "transferjob.h"

class ProgressChannel;

/**
 * @brief Latest Progress event of a folder or upload job.
 */
struct TransferProgress {
    QString label;
    int filesDone = 0;
    int filesTotal = 0;
    quint64 bytesDone = 0;
    quint64 bytesTotal = 0;
};

/**
 * @brief Single consumer of worker events and owner of the active set.
 *
 * Once per UI tick drain() pulls every pending ProgressEvent out of the
 * channel without blocking and folds it into the active transfers. This is
 * the only place where transfer-visible state changes, so none of it needs
 * a lock: workers only ever write to the channel.
 *
 * A Completed event removes the job, records a one-line status message and
 * asks for a refresh of the panel the job wrote into (local for downloads,
 * remote for uploads).
 */
class ProgressAggregator : public QObject
{
    Q_OBJECT

public:
    explicit ProgressAggregator(std::shared_ptr<ProgressChannel> channel, QObject *parent = nullptr);
    ~ProgressAggregator() override;

    /// @brief Records @p job as Active. Called right before its worker starts.
    void beginTransfer(const TransferJob &job);

    /**
     * @brief Applies every pending event from the channel.
     * @return Number of events processed.
     */
    int drain();

    /**
     * @brief Updates single-file downloads from the size of their file on disk.
     *
     * Approximate: the transport may write in bursts, so the value can lag or
     * briefly exceed the probed total.
     */
    void sampleLocalSizes();

    /// @name Active set
    /// @{
    [[nodiscard]] int activeCount() const { return active_.size(); }
    [[nodiscard]] int activeSingleDownloadCount() const;
    [[nodiscard]] bool isActive(quint64 jobId) const;
    [[nodiscard]] const QList<ActiveTransfer> &activeTransfers() const { return active_; }

    /// @brief The transfer that started last, or nullptr when idle.
    [[nodiscard]] const ActiveTransfer *mostRecentTransfer() const;

    [[nodiscard]] std::optional<TransferProgress> progressFor(quint64 jobId) const;

    /// @brief Local destination paths of active downloads.
    [[nodiscard]] QSet<QString> reservedLocalPaths() const;
    /// @}

    /// @name Rendering helpers
    /// @{

    /**
     * @brief Percentage of @p bytesDone over @p bytesTotal, clamped to [0, 100].
     * @return std::nullopt when the total is unknown (zero).
     */
    [[nodiscard]] static std::optional<int> percent(quint64 bytesDone, quint64 bytesTotal);

    /// @brief Clamped percentage for an active transfer, or std::nullopt if indeterminate.
    [[nodiscard]] std::optional<int> percentFor(const ActiveTransfer &transfer) const;
    /// @}

    [[nodiscard]] QString lastStatusMessage() const { return lastStatusMessage_; }

signals:
    void transferFinished(quint64 jobId, bool ok);
    void transferFailed(const QString &fileName, const QString &error);
    void panelRefreshRequested(PanelSide side);
    void statusMessage(const QString &message, int timeout);
    void activeTransfersChanged();

private:
    void applyProgress(const ProgressEvent &event);
    void applyCompleted(const ProgressEvent &event, bool &refreshLocal, bool &refreshRemote);
    [[nodiscard]] int indexOf(quint64 jobId) const;

    std::shared_ptr<ProgressChannel> channel_;
    QList<ActiveTransfer> active_;             // In start order
    QHash<quint64, TransferProgress> progress_;
    QString lastStatusMessage_;
};

#endif // PROGRESSAGGREGATOR_H
