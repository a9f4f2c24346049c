#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QLabel>
#include <QMainWindow>
#include <QTimer>

#include <memory>

#include "models/browsercontroller.h"
#include "utils/appconfig.h"

class ErrorHandler;
class FilePanelWidget;
class ITransport;
class TransferProgressWidget;
class TransferService;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(const AppConfig &config, std::shared_ptr<ITransport> transport,
               QWidget *parent = nullptr);
    ~MainWindow() override;

    /// @brief Lists both panels and starts the progress tick.
    void start();

    [[nodiscard]] BrowserController *controller() const { return controller_; }
    [[nodiscard]] TransferService *transferService() const { return transferService_; }
    [[nodiscard]] QString footerText() const { return footerLabel_->text(); }

protected:
    void keyPressEvent(QKeyEvent *event) override;
    bool focusNextPrevChild(bool next) override;

private slots:
    void onTick();
    void onDownloadRequested(const QString &remotePath, bool isDirectory, const QString &localDir);
    void onUploadRequested(const QString &localPath, bool isDirectory, const QString &remoteDir);
    void onPanelChanged(PanelSide side);
    void onFocusChanged(PanelSide side);
    void onModeChanged(BrowserController::Mode mode);
    void showStatus(const QString &message, int timeout);

private:
    void setupUi();
    void setupConnections();
    void updateFooter();
    void updateWindowTitle();
    [[nodiscard]] FilePanelWidget *panelWidget(PanelSide side) const;

    AppConfig config_;
    std::shared_ptr<ITransport> transport_;

    BrowserController *controller_ = nullptr;
    TransferService *transferService_ = nullptr;
    ErrorHandler *errorHandler_ = nullptr;

    FilePanelWidget *localPanel_ = nullptr;
    FilePanelWidget *remotePanel_ = nullptr;
    QLabel *footerLabel_ = nullptr;
    TransferProgressWidget *progressWidget_ = nullptr;

    QTimer *tickTimer_ = nullptr;
    QTimer *statusTimer_ = nullptr;
    QString statusMessage_;
};

#endif // MAINWINDOW_H
