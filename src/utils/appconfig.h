#ifndef APPCONFIG_H
#define APPCONFIG_H

#include <QColor>
#include <QString>

#include <optional>

class QSettings;

/**
 * @brief Four-colour palette used by both panels and the footer.
 */
struct Theme {
    QColor background;
    QColor foreground;
    QColor accent;      ///< Focused panel border and selection
    QColor muted;       ///< Unfocused panels, footer help

    /// @brief The default palette.
    [[nodiscard]] static Theme zenburn();

    /// @brief Application style sheet built from the palette.
    [[nodiscard]] QString styleSheet() const;
};

/**
 * @brief Settings read once at startup and passed to the window.
 *
 * Keys (QSettings, organisation/application "twinscp"):
 * - theme/background, theme/foreground, theme/accent, theme/muted: `#rrggbb`
 * - ui/tickIntervalMs: progress tick in milliseconds
 * - transport/sshProgram, transport/scpProgram: executables to run
 *
 * Missing or malformed values fall back to the defaults.
 */
struct AppConfig {
    static constexpr int DefaultTickIntervalMs = 150;

    Theme theme = Theme::zenburn();
    int tickIntervalMs = DefaultTickIntervalMs;
    QString sshProgram = QStringLiteral("ssh");
    QString scpProgram = QStringLiteral("scp");

    [[nodiscard]] static AppConfig load(QSettings &settings);

    /// @brief Parses `#rrggbb` (leading '#' optional, surrounding spaces ignored).
    [[nodiscard]] static std::optional<QColor> parseHexColor(const QString &text);
};

#endif // APPCONFIG_H
