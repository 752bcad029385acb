#include "VaultProvider.hpp"
#include "core/AtomicFile.hpp"
#include "core/Errors.hpp"
#include "core/Paths.hpp"
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <openssl/crypto.h>
#include <boost/log/trivial.hpp>

namespace sigil {

static constexpr int kEnvelopeVersion = 1;
static const QString kVaultFileName = QStringLiteral("secrets.enc.json");

namespace {

QByteArray encodeEntries(const Mapping& entries)
{
    QJsonObject obj;
    for (auto it = entries.constBegin(); it != entries.constEnd(); ++it)
        obj.insert(it.key(), it.value());
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

Mapping decodeEntries(const QString& path, const QByteArray& plain)
{
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(plain, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        throw CorruptFileError(path, QStringLiteral("decrypted payload is not a JSON object"));

    Mapping entries;
    const QJsonObject obj = doc.object();
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        if (!it.value().isString())
            throw CorruptFileError(path, QStringLiteral("non-string value for '%1'").arg(it.key()));
        entries.insert(it.key(), it.value().toString());
    }
    return entries;
}

void wipe(QByteArray& data)
{
    if (!data.isEmpty())
        OPENSSL_cleanse(data.data(), static_cast<size_t>(data.size()));
}

} // namespace

VaultProvider::VaultProvider(const QString& path, KdfParams params)
    : path_(path)
    , params_(params)
{
}

VaultProvider::~VaultProvider()
{
    wipe(passphrase_);
}

QString VaultProvider::defaultPath(const QString& providerId)
{
    return QDir(Paths::userConfigDir()).filePath(providerId + QLatin1Char('/') + kVaultFileName);
}

VaultProvider::State VaultProvider::state() const
{
    QMutexLocker lock(&mutex_);
    return state_;
}

VaultProvider::Envelope VaultProvider::readEnvelope() const
{
    const QByteArray raw = readWholeFile(path_);

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(raw, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        throw CorruptFileError(path_, QStringLiteral("vault envelope is not JSON: %1").arg(err.errorString()));

    const QJsonObject obj = doc.object();
    if (obj.value(QStringLiteral("version")).toInt() != kEnvelopeVersion)
        throw CorruptFileError(path_, QStringLiteral("unsupported vault version"));
    if (obj.value(QStringLiteral("kdf")).toString() != QLatin1String("scrypt"))
        throw CorruptFileError(path_, QStringLiteral("unsupported key derivation"));

    Envelope env;
    env.kdf.n = static_cast<quint64>(obj.value(QStringLiteral("n")).toDouble());
    env.kdf.r = static_cast<quint64>(obj.value(QStringLiteral("r")).toDouble());
    env.kdf.p = static_cast<quint64>(obj.value(QStringLiteral("p")).toDouble());
    env.salt = QByteArray::fromHex(obj.value(QStringLiteral("salt")).toString().toLatin1());
    env.nonce = QByteArray::fromHex(obj.value(QStringLiteral("nonce")).toString().toLatin1());
    env.cipher = QByteArray::fromHex(obj.value(QStringLiteral("cipher")).toString().toLatin1());

    if (!env.kdf.isSane())
        throw CorruptFileError(path_, QStringLiteral("scrypt parameters out of range"));
    if (env.salt.size() != VaultCipher::kSaltSize || env.nonce.size() != VaultCipher::kNonceSize
        || env.cipher.size() < VaultCipher::kTagSize)
        throw CorruptFileError(path_, QStringLiteral("truncated vault envelope"));
    return env;
}

void VaultProvider::persist(const VaultCipher& cipher, const QByteArray& salt, const KdfParams& kdf,
                            const Mapping& entries) const
{
    QByteArray plain = encodeEntries(entries);
    const QByteArray nonce = VaultCipher::randomBytes(VaultCipher::kNonceSize);
    const QByteArray sealed = cipher.encrypt(nonce, plain);
    wipe(plain);

    QJsonObject obj;
    obj.insert(QStringLiteral("version"), kEnvelopeVersion);
    obj.insert(QStringLiteral("kdf"), QStringLiteral("scrypt"));
    obj.insert(QStringLiteral("n"), static_cast<double>(kdf.n));
    obj.insert(QStringLiteral("r"), static_cast<double>(kdf.r));
    obj.insert(QStringLiteral("p"), static_cast<double>(kdf.p));
    obj.insert(QStringLiteral("salt"), QString::fromLatin1(salt.toHex()));
    obj.insert(QStringLiteral("nonce"), QString::fromLatin1(nonce.toHex()));
    obj.insert(QStringLiteral("cipher"), QString::fromLatin1(sealed.toHex()));

    writeFileAtomically(path_, QJsonDocument(obj).toJson(QJsonDocument::Indented));
}

void VaultProvider::unlock(const QString& passphrase)
{
    QMutexLocker lock(&mutex_);
    if (state_ == State::Unlocked)
        return;

    VaultCipher candidate;
    if (!QFileInfo::exists(path_)) {
        const QByteArray salt = VaultCipher::randomBytes(VaultCipher::kSaltSize);
        candidate.init(passphrase, salt, params_);
        cipher_.swap(candidate);
        salt_ = salt;
        activeParams_ = params_;
        passphrase_ = passphrase.toUtf8();
        state_ = State::Unlocked;
        BOOST_LOG_TRIVIAL(info) << "VaultProvider: unlocked new vault at " << path_.toStdString();
        return;
    }

    const Envelope env = readEnvelope();
    candidate.init(passphrase, env.salt, env.kdf);

    QByteArray plain;
    if (!candidate.decrypt(env.nonce, env.cipher, plain)) {
        BOOST_LOG_TRIVIAL(warning) << "VaultProvider: wrong passphrase for " << path_.toStdString();
        throw VaultLockedError(QStringLiteral("Wrong passphrase for vault %1").arg(path_));
    }
    const Mapping entries = decodeEntries(path_, plain);
    wipe(plain);

    cipher_.swap(candidate);
    salt_ = env.salt;
    activeParams_ = env.kdf;
    passphrase_ = passphrase.toUtf8();
    state_ = State::Unlocked;
    BOOST_LOG_TRIVIAL(info) << "VaultProvider: unlocked " << path_.toStdString()
                            << " (" << entries.size() << " entries)";
}

bool VaultProvider::unlockFromEnvironment(const char* variable)
{
    const QString passphrase = qEnvironmentVariable(variable);
    if (passphrase.isEmpty()) {
        BOOST_LOG_TRIVIAL(debug) << "VaultProvider: " << variable << " not set, vault stays locked";
        return false;
    }
    unlock(passphrase);
    return true;
}

void VaultProvider::requireUnlocked() const
{
    if (state_ != State::Unlocked)
        throw VaultLockedError(QStringLiteral("Vault %1 is locked").arg(path_));
}

// Caller holds mutex_.
void VaultProvider::relock()
{
    cipher_.deinit();
    wipe(passphrase_);
    passphrase_.clear();
    salt_.clear();
    state_ = State::Locked;
}

// Caller holds mutex_ and the vault is unlocked. Decrypts the current file;
// a missing file is an empty vault. Returns false, and relocks, when the
// file was re-keyed to a passphrase this process does not know.
bool VaultProvider::loadEntries(Mapping& entries)
{
    if (!QFileInfo::exists(path_)) {
        entries.clear();
        return true;
    }

    const Envelope env = readEnvelope();
    const bool sameKey = env.salt == salt_ && env.kdf.n == activeParams_.n
        && env.kdf.r == activeParams_.r && env.kdf.p == activeParams_.p;

    QByteArray plain;
    if (sameKey) {
        if (!cipher_.decrypt(env.nonce, env.cipher, plain))
            throw CorruptFileError(path_, QStringLiteral("vault contents failed authentication"));
    } else {
        VaultCipher candidate;
        candidate.init(QString::fromUtf8(passphrase_), env.salt, env.kdf);
        if (!candidate.decrypt(env.nonce, env.cipher, plain)) {
            BOOST_LOG_TRIVIAL(warning) << "VaultProvider: " << path_.toStdString()
                                       << " was re-keyed elsewhere, locking";
            relock();
            return false;
        }
        cipher_.swap(candidate);
        salt_ = env.salt;
        activeParams_ = env.kdf;
        BOOST_LOG_TRIVIAL(debug) << "VaultProvider: picked up new key for " << path_.toStdString();
    }

    entries = decodeEntries(path_, plain);
    wipe(plain);
    return true;
}

// Caller holds mutex_.
Mapping VaultProvider::loadEntriesOrThrow()
{
    requireUnlocked();
    Mapping entries;
    if (!loadEntries(entries))
        throw VaultLockedError(QStringLiteral("Vault %1 was re-keyed with another passphrase").arg(path_));
    return entries;
}

SecretLookup VaultProvider::get(const QString& key)
{
    QMutexLocker lock(&mutex_);
    if (state_ != State::Unlocked)
        return SecretLookup::locked(QStringLiteral("vault is locked"));

    Mapping entries;
    if (!loadEntries(entries))
        return SecretLookup::locked(QStringLiteral("vault was re-keyed"));

    auto it = entries.constFind(key);
    if (it == entries.constEnd())
        return SecretLookup::miss();
    return SecretLookup::hit(it.value());
}

void VaultProvider::set(const QString& key, const QString& value)
{
    QMutexLocker lock(&mutex_);
    Mapping entries = loadEntriesOrThrow();

    entries.insert(key, value);
    persist(cipher_, salt_, activeParams_, entries);
    BOOST_LOG_TRIVIAL(info) << "VaultProvider: stored " << key.toStdString();
}

bool VaultProvider::remove(const QString& key)
{
    QMutexLocker lock(&mutex_);
    Mapping entries = loadEntriesOrThrow();

    if (!entries.contains(key))
        return false;
    entries.remove(key);
    persist(cipher_, salt_, activeParams_, entries);
    BOOST_LOG_TRIVIAL(info) << "VaultProvider: removed " << key.toStdString();
    return true;
}

QStringList VaultProvider::keys()
{
    QMutexLocker lock(&mutex_);
    return loadEntriesOrThrow().keys();
}

void VaultProvider::rotateKey(const QString& newPassphrase)
{
    QMutexLocker lock(&mutex_);
    const Mapping entries = loadEntriesOrThrow();

    const QByteArray salt = VaultCipher::randomBytes(VaultCipher::kSaltSize);
    VaultCipher next;
    next.init(newPassphrase, salt, params_);

    // The old key stays active until the new file has replaced the old one.
    persist(next, salt, params_, entries);

    cipher_.swap(next);
    salt_ = salt;
    activeParams_ = params_;
    wipe(passphrase_);
    passphrase_ = newPassphrase.toUtf8();
    BOOST_LOG_TRIVIAL(info) << "VaultProvider: rotated key for " << path_.toStdString();
}

} // namespace sigil
