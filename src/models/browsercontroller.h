#ifndef BROWSERCONTROLLER_H
#define BROWSERCONTROLLER_H

#include <QObject>
#include <QString>

#include <memory>

#include "panelstate.h"
#include "services/remotedirectory.h"

class ITransport;

/**
 * @brief Keyboard-driven state of the two panels.
 *
 * Modes:
 * - Normal: Up/Down move, Tab switches focus, Enter opens, Backspace goes up,
 *   `d` downloads the remote selection, `u` uploads the local selection,
 *   `r` refreshes, `/` starts filtering, `q`/Esc quit.
 * - Filter: printable keys and Backspace edit a live filter on the focused
 *   panel; Esc restores the full listing; Up/Down/Enter keep working and
 *   Enter always returns to Normal.
 *
 * Transfers are not started here: the controller only emits
 * downloadRequested()/uploadRequested() with fully resolved paths.
 */
class BrowserController : public QObject
{
    Q_OBJECT

public:
    enum class Mode { Normal, Filter };
    Q_ENUM(Mode)

    explicit BrowserController(std::shared_ptr<ITransport> transport, QObject *parent = nullptr);
    ~BrowserController() override;

    /**
     * @brief Lists both panels for the first time.
     *
     * The remote panel opens at the login directory when it can be listed,
     * otherwise at "/". Focus starts on the remote panel.
     */
    void initialize(const QString &localHome);

    /**
     * @brief Feeds one key press into the state machine.
     * @param key A Qt::Key value.
     * @param text The text produced by the key, if any.
     * @return True if the key was consumed.
     */
    bool handleKey(int key, const QString &text = QString());

    /**
     * @brief Re-lists the current directory of @p side.
     *
     * The selection follows the previously selected name when it still
     * exists. An active filter on that panel is re-applied.
     */
    void refreshPanel(PanelSide side);

    [[nodiscard]] const PanelState &panel(PanelSide side) const;
    [[nodiscard]] PanelSide focus() const { return focus_; }
    [[nodiscard]] Mode mode() const { return mode_; }
    [[nodiscard]] QString filterText() const { return filterText_; }

    /// @brief Absolute path of the selected entry, or empty for none/"..".
    [[nodiscard]] QString selectedPath(PanelSide side) const;

signals:
    void downloadRequested(const QString &remotePath, bool isDirectory, const QString &localDir);
    void uploadRequested(const QString &localPath, bool isDirectory, const QString &remoteDir);
    void quitRequested();
    void panelChanged(PanelSide side);
    void focusChanged(PanelSide side);
    void modeChanged(BrowserController::Mode mode);
    void listingFailed(const QString &path, const QString &error);

private:
    bool handleFilterKey(int key, const QString &text);
    bool handleNormalKey(int key, const QString &text);

    void moveSelection(int delta);
    void switchFocus();
    void activateSelection();
    void goToParent();
    void requestDownload();
    void requestUpload();

    void enterFilterMode();
    void leaveFilterMode(bool restoreListing);

    /// @brief Lists @p path into @p side; keeps the panel unchanged on failure.
    bool navigate(PanelSide side, const QString &path);
    bool listInto(PanelSide side, const QString &path, QList<FileEntry> &listing);
    [[nodiscard]] QString parentOf(PanelSide side, const QString &path) const;

    PanelState &panelRef(PanelSide side);

    RemoteDirectory remote_;
    PanelState local_;
    PanelState remotePanel_;
    PanelSide focus_ = PanelSide::Remote;
    Mode mode_ = Mode::Normal;
    QString filterText_;
};

#endif // BROWSERCONTROLLER_H
