#include "filepanelwidget.h"
#include "models/panelstate.h"

#include <QStyle>
#include <QVBoxLayout>

FilePanelWidget::FilePanelWidget(const QString &titlePrefix, QWidget *parent)
    : QWidget(parent)
    , titlePrefix_(titlePrefix)
{
    setupUi();
}

void FilePanelWidget::setupUi()
{
    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(2, 2, 2, 2);
    layout->setSpacing(2);

    titleLabel_ = new QLabel(titlePrefix_);
    titleLabel_->setObjectName("panelTitle");
    layout->addWidget(titleLabel_);

    listWidget_ = new QListWidget();
    listWidget_->setFocusPolicy(Qt::NoFocus);
    listWidget_->setSelectionMode(QAbstractItemView::SingleSelection);
    listWidget_->setUniformItemSizes(true);
    layout->addWidget(listWidget_, 1);
}

void FilePanelWidget::render(const PanelState &state)
{
    titleLabel_->setText(QStringLiteral("%1 %2").arg(titlePrefix_, state.cwd));

    listWidget_->clear();
    for (const FileEntry &entry : state.entries) {
        const QString icon = entry.isDirectory ? QStringLiteral("📁") : QStringLiteral("📄");
        listWidget_->addItem(QStringLiteral("%1 %2").arg(icon, entry.name));
    }

    if (state.selectedIndex >= 0 && state.selectedIndex < listWidget_->count()) {
        listWidget_->setCurrentRow(state.selectedIndex);
        listWidget_->scrollToItem(listWidget_->currentItem());
    }
}

void FilePanelWidget::setFocused(bool focused)
{
    focused_ = focused;
    titleLabel_->setProperty("focused", focused);
    listWidget_->setProperty("focused", focused);
    repolish(titleLabel_);
    repolish(listWidget_);
}

void FilePanelWidget::repolish(QWidget *widget)
{
    // Dynamic properties only take effect in style sheets after a re-polish
    widget->style()->unpolish(widget);
    widget->style()->polish(widget);
}
