#pragma once

#include "ISecretProvider.hpp"
#include <QByteArray>
#include <QDBusArgument>
#include <QDBusConnection>
#include <QDBusObjectPath>
#include <QList>
#include <QMap>
#include <QMutex>

namespace sigil {

/// (oayays) Secret struct of the freedesktop Secret Service API.
struct DBusSecret {
    QDBusObjectPath session;
    QByteArray parameters;
    QByteArray value;
    QString contentType;
};

QDBusArgument& operator<<(QDBusArgument& arg, const DBusSecret& secret);
const QDBusArgument& operator>>(const QDBusArgument& arg, DBusSecret& secret);

using DBusStringMap = QMap<QString, QString>;

/// OS keyring through the freedesktop Secret Service (GNOME Keyring,
/// KWallet) on the D-Bus session bus.
///
/// Items carry the attributes {service: <service>, username: <key>}, the
/// same pair other keyring clients use, so entries are shared with them.
/// Headless hosts usually have no session bus or no secrets daemon; the
/// provider then reports itself unavailable and the chain moves on.
/// Calls block on D-Bus IPC with the bus default timeout.
class KeyringProvider : public ISecretProvider {
public:
    explicit KeyringProvider(const QString& service = QStringLiteral("sigil"));

    QString name() const override { return QStringLiteral("keyring"); }
    bool isAvailable() const override;
    bool supportsWrite() const override { return true; }

    SecretLookup get(const QString& key) override;
    void set(const QString& key, const QString& value) override;
    bool remove(const QString& key) override;

private:
    QString openSession();
    QList<QDBusObjectPath> searchItems(QDBusConnection& bus, const QString& key, bool& anyLocked);
    DBusStringMap attributesFor(const QString& key) const;

    QString service_;
    QMutex mutex_;
    QString sessionPath_;
};

} // namespace sigil

Q_DECLARE_METATYPE(sigil::DBusSecret)
