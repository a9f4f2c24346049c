#ifndef FILEPANELWIDGET_H
#define FILEPANELWIDGET_H

#include <QLabel>
#include <QListWidget>
#include <QWidget>

struct PanelState;

/**
 * @brief One side of the browser: a title line and the listing.
 *
 * Purely a view. Keyboard input never reaches the list (NoFocus); the main
 * window forwards keys to the BrowserController and calls render().
 */
class FilePanelWidget : public QWidget
{
    Q_OBJECT

public:
    explicit FilePanelWidget(const QString &titlePrefix, QWidget *parent = nullptr);

    void render(const PanelState &state);
    void setFocused(bool focused);

    [[nodiscard]] bool isFocused() const { return focused_; }
    [[nodiscard]] QString title() const { return titleLabel_->text(); }
    [[nodiscard]] QListWidget *listWidget() const { return listWidget_; }

private:
    void setupUi();
    void repolish(QWidget *widget);

    QString titlePrefix_;
    QLabel *titleLabel_ = nullptr;
    QListWidget *listWidget_ = nullptr;
    bool focused_ = false;
};

#endif // FILEPANELWIDGET_H
