#include "KeyringProvider.hpp"
#include "core/Errors.hpp"
#include <QDBusConnection>
#include <QDBusConnectionInterface>
#include <QDBusMessage>
#include <QDBusMetaType>
#include <QDBusVariant>
#include <QList>
#include <boost/log/trivial.hpp>

namespace sigil {

static const QString kSecretsService = QStringLiteral("org.freedesktop.secrets");
static const QString kSecretsPath = QStringLiteral("/org/freedesktop/secrets");
static const QString kServiceIface = QStringLiteral("org.freedesktop.Secret.Service");
static const QString kItemIface = QStringLiteral("org.freedesktop.Secret.Item");
static const QString kCollectionIface = QStringLiteral("org.freedesktop.Secret.Collection");
static const QString kDefaultCollection = QStringLiteral("/org/freedesktop/secrets/aliases/default");

QDBusArgument& operator<<(QDBusArgument& arg, const DBusSecret& secret)
{
    arg.beginStructure();
    arg << secret.session << secret.parameters << secret.value << secret.contentType;
    arg.endStructure();
    return arg;
}

const QDBusArgument& operator>>(const QDBusArgument& arg, DBusSecret& secret)
{
    arg.beginStructure();
    arg >> secret.session >> secret.parameters >> secret.value >> secret.contentType;
    arg.endStructure();
    return arg;
}

KeyringProvider::KeyringProvider(const QString& service)
    : service_(service)
{
    qDBusRegisterMetaType<DBusSecret>();
    qDBusRegisterMetaType<DBusStringMap>();
}

bool KeyringProvider::isAvailable() const
{
    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected())
        return false;
    QDBusConnectionInterface* iface = bus.interface();
    if (!iface)
        return false;
    if (iface->isServiceRegistered(kSecretsService))
        return true;
    // The daemon may be D-Bus activatable without running yet.
    const QStringList activatable = iface->activatableServiceNames();
    return activatable.contains(kSecretsService);
}

DBusStringMap KeyringProvider::attributesFor(const QString& key) const
{
    DBusStringMap attrs;
    attrs.insert(QStringLiteral("service"), service_);
    attrs.insert(QStringLiteral("username"), key);
    return attrs;
}

// Plain (unencrypted transport) session; the bus is local to the user.
QString KeyringProvider::openSession()
{
    if (!sessionPath_.isEmpty())
        return sessionPath_;

    QDBusMessage call = QDBusMessage::createMethodCall(kSecretsService, kSecretsPath, kServiceIface,
                                                       QStringLiteral("OpenSession"));
    call << QStringLiteral("plain") << QVariant::fromValue(QDBusVariant(QString()));

    QDBusMessage reply = QDBusConnection::sessionBus().call(call);
    if (reply.type() == QDBusMessage::ErrorMessage || reply.arguments().size() < 2)
        throw IoFailureError(QStringLiteral("Keyring OpenSession failed: %1").arg(reply.errorMessage()));

    sessionPath_ = reply.arguments().at(1).value<QDBusObjectPath>().path();
    return sessionPath_;
}

// Unlocked items matching key. Throws IoFailureError when the search fails.
QList<QDBusObjectPath> KeyringProvider::searchItems(QDBusConnection& bus, const QString& key, bool& anyLocked)
{
    QDBusMessage search = QDBusMessage::createMethodCall(kSecretsService, kSecretsPath, kServiceIface,
                                                         QStringLiteral("SearchItems"));
    search << QVariant::fromValue(attributesFor(key));
    QDBusMessage found = bus.call(search);
    if (found.type() == QDBusMessage::ErrorMessage || found.arguments().size() < 2)
        throw IoFailureError(QStringLiteral("Keyring SearchItems failed: %1").arg(found.errorMessage()));

    anyLocked = !qdbus_cast<QList<QDBusObjectPath>>(found.arguments().at(1)).isEmpty();
    return qdbus_cast<QList<QDBusObjectPath>>(found.arguments().at(0));
}

SecretLookup KeyringProvider::get(const QString& key)
{
    QMutexLocker lock(&mutex_);
    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected())
        return SecretLookup::unavailable(QStringLiteral("no session bus"));

    bool anyLocked = false;
    QList<QDBusObjectPath> unlocked;
    try {
        unlocked = searchItems(bus, key, anyLocked);
    } catch (const IoFailureError& e) {
        return SecretLookup::unavailable(e.message());
    }
    if (unlocked.isEmpty()) {
        if (anyLocked)
            return SecretLookup::unavailable(QStringLiteral("keyring collection is locked"));
        return SecretLookup::miss();
    }

    const QString session = openSession();
    QDBusMessage getSecret = QDBusMessage::createMethodCall(kSecretsService, unlocked.first().path(), kItemIface,
                                                            QStringLiteral("GetSecret"));
    getSecret << QVariant::fromValue(QDBusObjectPath(session));
    QDBusMessage reply = bus.call(getSecret);
    if (reply.type() == QDBusMessage::ErrorMessage || reply.arguments().isEmpty())
        return SecretLookup::unavailable(reply.errorMessage());

    const DBusSecret secret = qdbus_cast<DBusSecret>(reply.arguments().at(0));
    return SecretLookup::hit(QString::fromUtf8(secret.value));
}

void KeyringProvider::set(const QString& key, const QString& value)
{
    QMutexLocker lock(&mutex_);
    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected())
        throw IoFailureError(QStringLiteral("Keyring unavailable: no session bus"));

    DBusSecret secret;
    secret.session = QDBusObjectPath(openSession());
    secret.value = value.toUtf8();
    secret.contentType = QStringLiteral("text/plain; charset=utf8");

    QVariantMap properties;
    properties.insert(QStringLiteral("org.freedesktop.Secret.Item.Label"),
                      QStringLiteral("Password for '%1' on '%2'").arg(key, service_));
    properties.insert(QStringLiteral("org.freedesktop.Secret.Item.Attributes"),
                      QVariant::fromValue(attributesFor(key)));

    QDBusMessage create = QDBusMessage::createMethodCall(kSecretsService, kDefaultCollection, kCollectionIface,
                                                         QStringLiteral("CreateItem"));
    create << properties << QVariant::fromValue(secret) << true;
    QDBusMessage reply = bus.call(create);
    if (reply.type() == QDBusMessage::ErrorMessage || reply.arguments().size() < 2)
        throw IoFailureError(QStringLiteral("Keyring CreateItem failed: %1").arg(reply.errorMessage()));

    const QString prompt = reply.arguments().at(1).value<QDBusObjectPath>().path();
    if (prompt != QLatin1String("/"))
        throw IoFailureError(QStringLiteral("Keyring requires an interactive unlock prompt"));

    BOOST_LOG_TRIVIAL(debug) << "KeyringProvider: stored " << key.toStdString();
}

bool KeyringProvider::remove(const QString& key)
{
    QMutexLocker lock(&mutex_);
    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected())
        throw IoFailureError(QStringLiteral("Keyring unavailable: no session bus"));

    bool anyLocked = false;
    const QList<QDBusObjectPath> items = searchItems(bus, key, anyLocked);
    if (items.isEmpty()) {
        if (anyLocked)
            throw IoFailureError(QStringLiteral("Keyring collection is locked"));
        return false;
    }

    for (const auto& item : items) {
        QDBusMessage del = QDBusMessage::createMethodCall(kSecretsService, item.path(), kItemIface,
                                                          QStringLiteral("Delete"));
        QDBusMessage reply = bus.call(del);
        if (reply.type() == QDBusMessage::ErrorMessage || reply.arguments().isEmpty())
            throw IoFailureError(QStringLiteral("Keyring Delete failed: %1").arg(reply.errorMessage()));
        if (reply.arguments().at(0).value<QDBusObjectPath>().path() != QLatin1String("/"))
            throw IoFailureError(QStringLiteral("Keyring requires an interactive unlock prompt"));
    }

    BOOST_LOG_TRIVIAL(debug) << "KeyringProvider: removed " << key.toStdString();
    return true;
}

} // namespace sigil
