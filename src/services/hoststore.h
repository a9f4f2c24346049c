/**
 * @file hoststore.h
 * @brief Read-only access to the saved ssh host database.
 */

#ifndef HOSTSTORE_H
#define HOSTSTORE_H

#include <QByteArray>
#include <QMap>
#include <QString>
#include <QStringList>

#include <optional>

/**
 * @brief One saved host.
 */
struct Host {
    QString name;           ///< Alias
    QString host;           ///< Hostname or IP
    int port = 22;
    QString username = QStringLiteral("root");
    QString identityFile;   ///< Empty when not set
    QString proxyJump;      ///< Empty when not set
};

/**
 * @brief Host database shared with the host manager (`sshm/host.json`).
 *
 * Two layouts are accepted:
 * - current: `{"hosts": {"alias": {...}}, "folders": [...]}`
 * - legacy: `{"alias": {...}}`, where `ip` may stand in for `host`
 *
 * Entries without a host are skipped. The store is never written.
 */
class HostStore
{
public:
    HostStore() = default;

    /// @brief `<generic config dir>/sshm/host.json`.
    [[nodiscard]] static QString defaultPath();

    /**
     * @brief Replaces the contents with the hosts in @p path.
     * @param errorMessage Set when the file is missing or not valid JSON.
     * @return False on error, leaving the store empty.
     */
    bool load(const QString &path, QString *errorMessage = nullptr);

    /**
     * @brief Parses a host database document.
     * @return std::nullopt if @p data is not a JSON object.
     */
    [[nodiscard]] static std::optional<QMap<QString, Host>> fromJson(const QByteArray &data,
                                                                     QString *errorMessage = nullptr);

    [[nodiscard]] std::optional<Host> find(const QString &alias) const;
    [[nodiscard]] QStringList aliases() const { return hosts_.keys(); }
    [[nodiscard]] QStringList folders() const { return folders_; }
    [[nodiscard]] int size() const { return hosts_.size(); }
    [[nodiscard]] bool isEmpty() const { return hosts_.isEmpty(); }

private:
    QMap<QString, Host> hosts_;
    QStringList folders_;
};

#endif // HOSTSTORE_H
