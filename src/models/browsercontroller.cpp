#include "browsercontroller.h"
#include "services/itransport.h"
#include "services/localdirectory.h"
#include "utils/logging.h"
#include "utils/pathutils.h"

#include <QDir>

#include <utility>

BrowserController::BrowserController(std::shared_ptr<ITransport> transport, QObject *parent)
    : QObject(parent)
    , remote_(std::move(transport))
{
}

BrowserController::~BrowserController() = default;

void BrowserController::initialize(const QString &localHome)
{
    focus_ = PanelSide::Remote;
    mode_ = Mode::Normal;
    filterText_.clear();

    if (!navigate(PanelSide::Local, QDir::cleanPath(localHome))) {
        // Show the path anyway so the user knows where we tried
        local_.setListing(QDir::cleanPath(localHome), {});
        emit panelChanged(PanelSide::Local);
    }

    const QString home = remote_.homeDirectory();
    if (home.isEmpty() || !navigate(PanelSide::Remote, home)) {
        LOG_VERBOSE() << "BrowserController: remote home" << home << "not listable, falling back to /";
        if (!navigate(PanelSide::Remote, QStringLiteral("/"))) {
            remotePanel_.setListing(QStringLiteral("/"), {});
            emit panelChanged(PanelSide::Remote);
        }
    }

    emit focusChanged(focus_);
}

bool BrowserController::handleKey(int key, const QString &text)
{
    if (mode_ == Mode::Filter) {
        return handleFilterKey(key, text);
    }
    return handleNormalKey(key, text);
}

bool BrowserController::handleFilterKey(int key, const QString &text)
{
    switch (key) {
    case Qt::Key_Escape:
        leaveFilterMode(true);
        return true;
    case Qt::Key_Backspace:
        filterText_.chop(1);
        panelRef(focus_).applyFilter(filterText_);
        emit panelChanged(focus_);
        return true;
    case Qt::Key_Up:
        moveSelection(-1);
        return true;
    case Qt::Key_Down:
        moveSelection(1);
        return true;
    case Qt::Key_Return:
    case Qt::Key_Enter:
        activateSelection();
        return true;
    case Qt::Key_Tab:
        leaveFilterMode(true);
        switchFocus();
        return true;
    default:
        break;
    }

    if (!text.isEmpty() && text.at(0).isPrint()) {
        filterText_ += text;
        panelRef(focus_).applyFilter(filterText_);
        emit panelChanged(focus_);
        return true;
    }
    return false;
}

bool BrowserController::handleNormalKey(int key, const QString &text)
{
    switch (key) {
    case Qt::Key_Escape:
        emit quitRequested();
        return true;
    case Qt::Key_Up:
        moveSelection(-1);
        return true;
    case Qt::Key_Down:
        moveSelection(1);
        return true;
    case Qt::Key_Tab:
        switchFocus();
        return true;
    case Qt::Key_Return:
    case Qt::Key_Enter:
        activateSelection();
        return true;
    case Qt::Key_Backspace:
        goToParent();
        return true;
    default:
        break;
    }

    if (text == QLatin1String("/")) {
        enterFilterMode();
        return true;
    }
    if (text == QLatin1String("q")) {
        emit quitRequested();
        return true;
    }
    if (text == QLatin1String("d")) {
        requestDownload();
        return true;
    }
    if (text == QLatin1String("u")) {
        requestUpload();
        return true;
    }
    if (text == QLatin1String("r")) {
        refreshPanel(focus_);
        return true;
    }
    return false;
}

void BrowserController::refreshPanel(PanelSide side)
{
    PanelState &panel = panelRef(side);
    if (panel.cwd.isEmpty()) {
        return;
    }

    QList<FileEntry> listing;
    if (!listInto(side, panel.cwd, listing)) {
        return;
    }

    const FileEntry *selected = panel.selectedEntry();
    const QString selectedName = selected ? selected->name : QString();

    const QString cwd = panel.cwd;
    panel.setListing(cwd, listing);
    if (mode_ == Mode::Filter && side == focus_) {
        panel.applyFilter(filterText_);
    }

    for (int i = 0; i < panel.entries.size(); ++i) {
        if (panel.entries.at(i).name == selectedName) {
            panel.selectedIndex = i;
            break;
        }
    }
    emit panelChanged(side);
}

const PanelState &BrowserController::panel(PanelSide side) const
{
    return side == PanelSide::Local ? local_ : remotePanel_;
}

QString BrowserController::selectedPath(PanelSide side) const
{
    const PanelState &state = panel(side);
    const FileEntry *entry = state.selectedEntry();
    if (!entry || entry->isParentLink()) {
        return QString();
    }
    if (side == PanelSide::Local) {
        return QDir(state.cwd).filePath(entry->name);
    }
    return PathUtils::joinRemotePath(state.cwd, entry->name);
}

void BrowserController::moveSelection(int delta)
{
    panelRef(focus_).moveSelection(delta);
    emit panelChanged(focus_);
}

void BrowserController::switchFocus()
{
    focus_ = focus_ == PanelSide::Local ? PanelSide::Remote : PanelSide::Local;
    emit focusChanged(focus_);
}

void BrowserController::activateSelection()
{
    const PanelState &state = panelRef(focus_);
    const FileEntry *entry = state.selectedEntry();

    bool navigated = false;
    if (entry && entry->isDirectory) {
        const QString target = entry->isParentLink()
            ? parentOf(focus_, state.cwd)
            : (focus_ == PanelSide::Local ? QDir(state.cwd).filePath(entry->name)
                                          : PathUtils::joinRemotePath(state.cwd, entry->name));
        if (!target.isEmpty()) {
            navigated = navigate(focus_, target);
        }
    }

    // Enter always ends filtering; a successful navigate already replaced the listing
    if (mode_ == Mode::Filter) {
        leaveFilterMode(!navigated);
    }
}

void BrowserController::goToParent()
{
    const QString parent = parentOf(focus_, panelRef(focus_).cwd);
    if (!parent.isEmpty() && parent != panelRef(focus_).cwd) {
        navigate(focus_, parent);
    }
}

void BrowserController::requestDownload()
{
    if (focus_ != PanelSide::Remote) {
        return;
    }
    const FileEntry *entry = remotePanel_.selectedEntry();
    if (!entry || entry->isParentLink()) {
        return;
    }
    emit downloadRequested(PathUtils::joinRemotePath(remotePanel_.cwd, entry->name),
                           entry->isDirectory, local_.cwd);
}

void BrowserController::requestUpload()
{
    if (focus_ != PanelSide::Local) {
        return;
    }
    const FileEntry *entry = local_.selectedEntry();
    if (!entry || entry->isParentLink()) {
        return;
    }
    emit uploadRequested(QDir(local_.cwd).filePath(entry->name), entry->isDirectory,
                         remotePanel_.cwd);
}

void BrowserController::enterFilterMode()
{
    mode_ = Mode::Filter;
    filterText_.clear();
    emit modeChanged(mode_);
}

void BrowserController::leaveFilterMode(bool restoreListing)
{
    if (restoreListing) {
        panelRef(focus_).clearFilter();
        emit panelChanged(focus_);
    }
    mode_ = Mode::Normal;
    filterText_.clear();
    emit modeChanged(mode_);
}

bool BrowserController::navigate(PanelSide side, const QString &path)
{
    QList<FileEntry> listing;
    if (!listInto(side, path, listing)) {
        return false;
    }
    panelRef(side).setListing(path, listing);
    emit panelChanged(side);
    return true;
}

bool BrowserController::listInto(PanelSide side, const QString &path, QList<FileEntry> &listing)
{
    if (side == PanelSide::Local) {
        QString error;
        auto entries = LocalDirectory::listLocal(path, &error);
        if (!entries) {
            emit listingFailed(path, error);
            return false;
        }
        listing = *entries;
    } else {
        bool ok = false;
        listing = remote_.listRemote(path, &ok);
        if (!ok) {
            emit listingFailed(path, tr("remote directory unreachable"));
            return false;
        }
    }

    if (!parentOf(side, path).isEmpty()) {
        listing.prepend(FileEntry::parentLink());
    }
    return true;
}

QString BrowserController::parentOf(PanelSide side, const QString &path) const
{
    if (side == PanelSide::Local) {
        return LocalDirectory::parentDirectory(path);
    }
    if (path == QLatin1String("/")) {
        return QString();
    }
    return PathUtils::parentRemotePath(path);
}

PanelState &BrowserController::panelRef(PanelSide side)
{
    return side == PanelSide::Local ? local_ : remotePanel_;
}
