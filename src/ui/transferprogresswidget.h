#ifndef TRANSFERPROGRESSWIDGET_H
#define TRANSFERPROGRESSWIDGET_H

#include <QDateTime>
#include <QLabel>
#include <QProgressBar>
#include <QWidget>

class ProgressAggregator;
struct ActiveTransfer;

/**
 * @brief Second footer line: the most recently started transfer.
 *
 * Shows "Downloading name" (or Uploading) with a percentage bar when the
 * total is known and a busy bar otherwise, followed by the number of queued
 * downloads. Hidden while nothing is active.
 */
class TransferProgressWidget : public QWidget
{
    Q_OBJECT

public:
    explicit TransferProgressWidget(QWidget *parent = nullptr);

    /// @brief Redraws from the aggregator's current state. Called once per tick.
    void render(const ProgressAggregator &aggregator, int queuedCount);

    /**
     * @brief Text of the status label for the given state.
     * @param now Reference time for the rate; a transfer shows its rate after one second.
     */
    [[nodiscard]] static QString describe(const ProgressAggregator &aggregator, int queuedCount,
                                          const QDateTime &now = QDateTime::currentDateTime());

    /// @brief Average rate such as "512 B/s" or "1.5 MB/s"; empty if elapsedMs is not positive.
    [[nodiscard]] static QString formatRate(quint64 bytes, qint64 elapsedMs);

    [[nodiscard]] QString statusText() const { return statusLabel_->text(); }
    [[nodiscard]] int progressValue() const { return progressBar_->value(); }
    [[nodiscard]] bool isIndeterminate() const { return progressBar_->maximum() == 0; }

private:
    void setupUi();

    QLabel *statusLabel_ = nullptr;
    QProgressBar *progressBar_ = nullptr;
};

#endif // TRANSFERPROGRESSWIDGET_H
