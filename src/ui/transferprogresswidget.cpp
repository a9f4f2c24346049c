#include "transferprogresswidget.h"
#include "models/progressaggregator.h"

#include <QHBoxLayout>

TransferProgressWidget::TransferProgressWidget(QWidget *parent)
    : QWidget(parent)
{
    setupUi();
}

void TransferProgressWidget::setupUi()
{
    auto *layout = new QHBoxLayout(this);
    layout->setContentsMargins(8, 0, 8, 0);

    statusLabel_ = new QLabel();
    statusLabel_->setMinimumWidth(200);
    layout->addWidget(statusLabel_);

    progressBar_ = new QProgressBar();
    progressBar_->setRange(0, 100);
    progressBar_->setValue(0);
    progressBar_->setMaximumHeight(14);
    progressBar_->setFocusPolicy(Qt::NoFocus);
    layout->addWidget(progressBar_, 1);

    setVisible(false);
}

QString TransferProgressWidget::describe(const ProgressAggregator &aggregator, int queuedCount,
                                         const QDateTime &now)
{
    const ActiveTransfer *transfer = aggregator.mostRecentTransfer();
    if (!transfer) {
        return queuedCount > 0 ? tr("%1 queued").arg(queuedCount) : QString();
    }

    const QString verb = transfer->job.kind == TransferKind::Download ? tr("Downloading")
                                                                      : tr("Uploading");
    QString text = QStringLiteral("%1 %2").arg(verb, transfer->job.fileName);

    if (auto view = aggregator.progressFor(transfer->job.id)) {
        if (view->filesTotal > 0) {
            text += QStringLiteral(" [%1/%2]").arg(QString::number(view->filesDone),
                                                   QString::number(view->filesTotal));
        }
    }

    if (auto percent = aggregator.percentFor(*transfer)) {
        text += QStringLiteral(" %1%").arg(*percent);
    }

    constexpr qint64 MinRateElapsedMs = 1000;
    const qint64 elapsedMs = transfer->startedAt.msecsTo(now);
    if (transfer->bytesDone > 0 && elapsedMs >= MinRateElapsedMs) {
        text += QStringLiteral(" %1").arg(formatRate(transfer->bytesDone, elapsedMs));
    }

    const int others = aggregator.activeCount() - 1;
    if (others > 0) {
        text += tr(" (+%1 active)").arg(others);
    }
    if (queuedCount > 0) {
        text += tr(" (%1 queued)").arg(queuedCount);
    }
    return text;
}

QString TransferProgressWidget::formatRate(quint64 bytes, qint64 elapsedMs)
{
    if (elapsedMs <= 0) {
        return QString();
    }

    constexpr double KB = 1024.0;
    constexpr double MB = 1024.0 * 1024.0;
    const double perSecond = static_cast<double>(bytes) * 1000.0 / static_cast<double>(elapsedMs);

    if (perSecond < KB) {
        return QString("%1 B/s").arg(static_cast<quint64>(perSecond));
    }
    if (perSecond < MB) {
        return QString("%1 KB/s").arg(perSecond / KB, 0, 'f', 1);
    }
    return QString("%1 MB/s").arg(perSecond / MB, 0, 'f', 1);
}

void TransferProgressWidget::render(const ProgressAggregator &aggregator, int queuedCount)
{
    const ActiveTransfer *transfer = aggregator.mostRecentTransfer();
    if (!transfer && queuedCount == 0) {
        setVisible(false);
        return;
    }

    statusLabel_->setText(describe(aggregator, queuedCount));

    std::optional<int> percent = transfer ? aggregator.percentFor(*transfer) : std::nullopt;
    if (percent) {
        progressBar_->setRange(0, 100);
        progressBar_->setValue(*percent);
    } else {
        // Busy indicator
        progressBar_->setRange(0, 0);
    }

    setVisible(true);
}
