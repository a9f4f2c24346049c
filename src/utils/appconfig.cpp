#include "appconfig.h"

#include <QDebug>
#include <QSettings>

namespace {

QColor colorSetting(QSettings &settings, const QString &key, const QColor &fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    const QString value = settings.value(key).toString();
    auto color = AppConfig::parseHexColor(value);
    if (!color) {
        qWarning() << "AppConfig: ignoring invalid colour" << value << "for" << key;
        return fallback;
    }
    return *color;
}

QString programSetting(QSettings &settings, const QString &key, const QString &fallback)
{
    const QString value = settings.value(key, fallback).toString().trimmed();
    return value.isEmpty() ? fallback : value;
}

} // namespace

Theme Theme::zenburn()
{
    Theme theme;
    theme.background = QColor(40, 40, 40);
    theme.foreground = QColor(220, 220, 204);
    theme.accent = QColor(181, 189, 104);
    theme.muted = QColor(150, 150, 150);
    return theme;
}

QString Theme::styleSheet() const
{
    const QString bg = background.name();
    const QString fg = foreground.name();
    const QString ac = accent.name();
    const QString mu = muted.name();

    return QStringLiteral(
        "QWidget { background-color: %1; color: %2; }\n"
        "QListWidget { border: 1px solid %4; outline: none; }\n"
        "QListWidget[focused=\"true\"] { border: 1px solid %3; }\n"
        "QListWidget::item:selected { background-color: %3; color: %1; }\n"
        "QLabel#panelTitle { color: %4; font-weight: bold; }\n"
        "QLabel#panelTitle[focused=\"true\"] { color: %3; }\n"
        "QLabel#footerHelp { color: %4; }\n"
        "QProgressBar { border: 1px solid %4; text-align: center; }\n"
        "QProgressBar::chunk { background-color: %3; }\n")
        .arg(bg, fg, ac, mu);
}

AppConfig AppConfig::load(QSettings &settings)
{
    AppConfig config;
    const Theme defaults = Theme::zenburn();

    config.theme.background = colorSetting(settings, QStringLiteral("theme/background"), defaults.background);
    config.theme.foreground = colorSetting(settings, QStringLiteral("theme/foreground"), defaults.foreground);
    config.theme.accent = colorSetting(settings, QStringLiteral("theme/accent"), defaults.accent);
    config.theme.muted = colorSetting(settings, QStringLiteral("theme/muted"), defaults.muted);

    bool ok = false;
    int tick = settings.value(QStringLiteral("ui/tickIntervalMs"), DefaultTickIntervalMs).toInt(&ok);
    if (!ok || tick <= 0) {
        qWarning() << "AppConfig: invalid ui/tickIntervalMs, using" << DefaultTickIntervalMs;
        tick = DefaultTickIntervalMs;
    }
    config.tickIntervalMs = tick;

    config.sshProgram = programSetting(settings, QStringLiteral("transport/sshProgram"), config.sshProgram);
    config.scpProgram = programSetting(settings, QStringLiteral("transport/scpProgram"), config.scpProgram);
    return config;
}

std::optional<QColor> AppConfig::parseHexColor(const QString &text)
{
    QString hex = text.trimmed();
    if (hex.startsWith('#')) {
        hex.remove(0, 1);
    }
    if (hex.size() != 6) {
        return std::nullopt;
    }

    bool ok = false;
    const uint rgb = hex.toUInt(&ok, 16);
    if (!ok) {
        return std::nullopt;
    }
    return QColor((rgb >> 16) & 0xFF, (rgb >> 8) & 0xFF, rgb & 0xFF);
}
