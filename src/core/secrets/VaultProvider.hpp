#pragma once

#include "ISecretProvider.hpp"
#include "VaultCipher.hpp"
#include "core/Mapping.hpp"
#include <QMutex>
#include <QStringList>

namespace sigil {

/// Passphrase-encrypted secrets file.
///
/// The file is a JSON envelope {version, kdf, n, r, p, salt, nonce, cipher}
/// with hex-encoded binary fields; the ciphertext decrypts to a JSON object
/// of string values. Every write re-encrypts the whole mapping with a fresh
/// nonce and replaces the file with temp-then-rename.
///
/// Every operation decrypts the file as it is on disk, so writes from
/// other processes sharing the vault are seen and never overwritten. If
/// another process re-keyed the vault, the key is derived again from the
/// remembered passphrase; when that no longer opens the file the provider
/// drops back to Locked.
///
/// Starts Locked. unlock() moves it to Unlocked; there is no explicit
/// re-lock.
class VaultProvider : public ISecretProvider {
public:
    enum class State { Locked, Unlocked };

    explicit VaultProvider(const QString& path, KdfParams params = KdfParams());
    ~VaultProvider() override;

    /// <user config>/sigil/<provider>/secrets.enc.json
    static QString defaultPath(const QString& providerId);

    QString name() const override { return QStringLiteral("vault"); }
    bool isAvailable() const override { return true; }
    bool supportsWrite() const override { return true; }

    const QString& path() const { return path_; }
    State state() const;
    bool isUnlocked() const { return state() == State::Unlocked; }

    /// Derive the key and check it against the existing file. A missing file
    /// is an empty vault that will be created on first set(). Calling again
    /// once unlocked does nothing.
    /// Throws VaultLockedError on a wrong passphrase, CorruptFileError on an
    /// unreadable envelope.
    void unlock(const QString& passphrase);

    /// unlock() with the passphrase from variable. Returns false, staying
    /// Locked, when the variable is unset or empty.
    bool unlockFromEnvironment(const char* variable = "SIGIL_MASTER_PWD");

    SecretLookup get(const QString& key) override;

    /// Throws VaultLockedError while Locked.
    void set(const QString& key, const QString& value) override;

    /// Throws VaultLockedError while Locked. Returns false if key was absent.
    bool remove(const QString& key) override;

    /// Throws VaultLockedError while Locked.
    QStringList keys();

    /// Re-encrypt everything under newPassphrase with a fresh salt. The file
    /// is replaced atomically: an interruption leaves the old vault intact
    /// and still readable with the old passphrase.
    void rotateKey(const QString& newPassphrase);

private:
    struct Envelope {
        KdfParams kdf;
        QByteArray salt;
        QByteArray nonce;
        QByteArray cipher;
    };

    Envelope readEnvelope() const;
    bool loadEntries(Mapping& entries);
    Mapping loadEntriesOrThrow();
    void relock();
    void persist(const VaultCipher& cipher, const QByteArray& salt, const KdfParams& kdf,
                 const Mapping& entries) const;
    void requireUnlocked() const;

    QString path_;
    KdfParams params_;

    mutable QMutex mutex_;
    State state_ = State::Locked;
    VaultCipher cipher_;
    QByteArray salt_;
    KdfParams activeParams_;
    QByteArray passphrase_;
};

} // namespace sigil
