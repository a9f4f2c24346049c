#include "hoststore.h"
#include "utils/logging.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QStandardPaths>

namespace {

std::optional<Host> hostFromJson(const QString &alias, const QJsonObject &object)
{
    Host host;
    host.name = object.value("name").toString(alias);
    host.host = object.value("host").toString();
    if (host.host.isEmpty()) {
        host.host = object.value("ip").toString();
    }
    if (host.host.isEmpty()) {
        return std::nullopt;
    }

    host.port = object.value("port").toInt(22);
    if (host.port <= 0 || host.port > 65535) {
        qWarning() << "HostStore: invalid port for" << alias << "- using 22";
        host.port = 22;
    }
    host.username = object.value("username").toString(QStringLiteral("root"));
    host.identityFile = object.value("identity_file").toString();
    host.proxyJump = object.value("proxy_jump").toString();
    return host;
}

} // namespace

QString HostStore::defaultPath()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    if (base.isEmpty()) {
        base = QDir::homePath() + QStringLiteral("/.config");
    }
    return base + QStringLiteral("/sshm/host.json");
}

bool HostStore::load(const QString &path, QString *errorMessage)
{
    hosts_.clear();
    folders_.clear();

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1: %2").arg(path, file.errorString());
        }
        return false;
    }

    const QByteArray data = file.readAll();
    QString parseError;
    auto hosts = fromJson(data, &parseError);
    if (!hosts) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1: %2").arg(path, parseError);
        }
        return false;
    }
    hosts_ = *hosts;

    // folders are informational only
    const QJsonObject root = QJsonDocument::fromJson(data).object();
    for (const QJsonValue &folder : root.value("folders").toArray()) {
        if (!folder.toString().isEmpty()) {
            folders_.append(folder.toString());
        }
    }

    LOG_VERBOSE() << "HostStore: loaded" << hosts_.size() << "hosts from" << path;
    return true;
}

std::optional<QMap<QString, Host>> HostStore::fromJson(const QByteArray &data, QString *errorMessage)
{
    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError) {
        if (errorMessage) {
            *errorMessage = error.errorString();
        }
        return std::nullopt;
    }
    if (!doc.isObject()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("top-level value is not an object");
        }
        return std::nullopt;
    }

    QJsonObject root = doc.object();
    QJsonObject hostMap = root.value("hosts").isObject() ? root.value("hosts").toObject() : root;

    QMap<QString, Host> hosts;
    for (auto it = hostMap.constBegin(); it != hostMap.constEnd(); ++it) {
        if (!it.value().isObject()) {
            continue;
        }
        auto host = hostFromJson(it.key(), it.value().toObject());
        if (host) {
            hosts.insert(it.key(), *host);
        } else {
            LOG_VERBOSE() << "HostStore: skipping" << it.key() << "(no host)";
        }
    }
    return hosts;
}

std::optional<Host> HostStore::find(const QString &alias) const
{
    auto it = hosts_.constFind(alias);
    if (it == hosts_.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}
