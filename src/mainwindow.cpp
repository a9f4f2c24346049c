#include "mainwindow.h"
#include "services/errorhandler.h"
#include "services/itransport.h"
#include "services/transferservice.h"
#include "ui/filepanelwidget.h"
#include "ui/transferprogresswidget.h"
#include "utils/logging.h"

#include <QDir>
#include <QHBoxLayout>
#include <QKeyEvent>
#include <QVBoxLayout>

#include <utility>

MainWindow::MainWindow(const AppConfig &config, std::shared_ptr<ITransport> transport,
                       QWidget *parent)
    : QMainWindow(parent)
    , config_(config)
    , transport_(std::move(transport))
    , controller_(new BrowserController(transport_, this))
    , transferService_(new TransferService(transport_, this))
    , errorHandler_(new ErrorHandler(this, this))
    , tickTimer_(new QTimer(this))
    , statusTimer_(new QTimer(this))
{
    tickTimer_->setInterval(config_.tickIntervalMs);
    statusTimer_->setSingleShot(true);

    setupUi();
    setupConnections();
    updateWindowTitle();
    updateFooter();

    resize(1100, 700);
    setMinimumSize(640, 400);
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi()
{
    setStyleSheet(config_.theme.styleSheet());
    setFocusPolicy(Qt::StrongFocus);

    auto *centralContainer = new QWidget(this);
    auto *layout = new QVBoxLayout(centralContainer);
    layout->setContentsMargins(4, 4, 4, 4);
    layout->setSpacing(2);

    auto *panels = new QHBoxLayout();
    localPanel_ = new FilePanelWidget(tr("Local:"));
    remotePanel_ = new FilePanelWidget(tr("Remote: %1 -").arg(transport_->describeTarget()));
    panels->addWidget(localPanel_, 1);
    panels->addWidget(remotePanel_, 1);
    layout->addLayout(panels, 1);

    footerLabel_ = new QLabel();
    footerLabel_->setObjectName("footerHelp");
    layout->addWidget(footerLabel_);

    progressWidget_ = new TransferProgressWidget();
    layout->addWidget(progressWidget_);

    setCentralWidget(centralContainer);
}

void MainWindow::setupConnections()
{
    // Browser state
    connect(controller_, &BrowserController::panelChanged,
            this, &MainWindow::onPanelChanged);
    connect(controller_, &BrowserController::focusChanged,
            this, &MainWindow::onFocusChanged);
    connect(controller_, &BrowserController::modeChanged,
            this, &MainWindow::onModeChanged);
    connect(controller_, &BrowserController::downloadRequested,
            this, &MainWindow::onDownloadRequested);
    connect(controller_, &BrowserController::uploadRequested,
            this, &MainWindow::onUploadRequested);
    connect(controller_, &BrowserController::quitRequested,
            this, &MainWindow::close);

    // Route error signals through ErrorHandler for consistent presentation
    connect(controller_, &BrowserController::listingFailed,
            errorHandler_, &ErrorHandler::handleListingError);
    connect(transferService_->aggregator(), &ProgressAggregator::transferFailed,
            errorHandler_, &ErrorHandler::handleTransferFailed);
    connect(errorHandler_, &ErrorHandler::statusMessage,
            this, &MainWindow::showStatus);

    connect(transferService_, &TransferService::statusMessage,
            this, &MainWindow::showStatus);

    // Completed jobs ask for their destination panel to be re-listed
    connect(transferService_->aggregator(), &ProgressAggregator::panelRefreshRequested,
            controller_, &BrowserController::refreshPanel);

    connect(tickTimer_, &QTimer::timeout, this, &MainWindow::onTick);
    connect(statusTimer_, &QTimer::timeout, this, [this]() {
        statusMessage_.clear();
        updateFooter();
    });
}

void MainWindow::start()
{
    LOG_VERBOSE() << "MainWindow: starting browser for" << transport_->describeTarget()
                  << "tick" << config_.tickIntervalMs << "ms";
    controller_->initialize(QDir::homePath());
    onFocusChanged(controller_->focus());
    tickTimer_->start();
}

void MainWindow::keyPressEvent(QKeyEvent *event)
{
    if (event->modifiers() & (Qt::ControlModifier | Qt::AltModifier | Qt::MetaModifier)) {
        QMainWindow::keyPressEvent(event);
        return;
    }

    if (!controller_->handleKey(event->key(), event->text())) {
        QMainWindow::keyPressEvent(event);
    }
}

bool MainWindow::focusNextPrevChild(bool next)
{
    Q_UNUSED(next)
    // Tab switches panels instead of moving keyboard focus
    return false;
}

void MainWindow::onTick()
{
    transferService_->tick();
    progressWidget_->render(*transferService_->aggregator(), transferService_->queuedCount());
}

void MainWindow::onDownloadRequested(const QString &remotePath, bool isDirectory,
                                     const QString &localDir)
{
    if (isDirectory) {
        transferService_->downloadDirectory(remotePath, localDir);
    } else {
        transferService_->downloadFile(remotePath, localDir);
    }
    progressWidget_->render(*transferService_->aggregator(), transferService_->queuedCount());
}

void MainWindow::onUploadRequested(const QString &localPath, bool isDirectory,
                                   const QString &remoteDir)
{
    if (isDirectory) {
        transferService_->uploadDirectory(localPath, remoteDir);
    } else {
        transferService_->uploadFile(localPath, remoteDir);
    }
    progressWidget_->render(*transferService_->aggregator(), transferService_->queuedCount());
}

void MainWindow::onPanelChanged(PanelSide side)
{
    panelWidget(side)->render(controller_->panel(side));
    if (controller_->mode() == BrowserController::Mode::Filter) {
        updateFooter();
    }
}

void MainWindow::onFocusChanged(PanelSide side)
{
    localPanel_->setFocused(side == PanelSide::Local);
    remotePanel_->setFocused(side == PanelSide::Remote);
    updateFooter();
}

void MainWindow::onModeChanged(BrowserController::Mode mode)
{
    Q_UNUSED(mode)
    updateFooter();
}

void MainWindow::showStatus(const QString &message, int timeout)
{
    statusMessage_ = message;
    if (timeout > 0) {
        statusTimer_->start(timeout);
    } else {
        statusTimer_->stop();
    }
    updateFooter();
}

void MainWindow::updateFooter()
{
    if (controller_->mode() == BrowserController::Mode::Filter) {
        footerLabel_->setText(tr("Filter: %1").arg(controller_->filterText()));
        return;
    }

    if (!statusMessage_.isEmpty()) {
        footerLabel_->setText(statusMessage_);
        return;
    }

    footerLabel_->setText(tr("Tab: switch panel • Enter: open dir • Backspace: up • /: filter"
                             " • d: download (remote) • u: upload (local) • r: refresh • q: quit"));
}

void MainWindow::updateWindowTitle()
{
    setWindowTitle(tr("twinscp - %1").arg(transport_->describeTarget()));
}

FilePanelWidget *MainWindow::panelWidget(PanelSide side) const
{
    return side == PanelSide::Local ? localPanel_ : remotePanel_;
}
