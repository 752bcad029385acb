#pragma once

#include <QByteArray>
#include <QString>
#include <QtGlobal>

namespace sigil {

/// scrypt cost parameters, stored alongside the salt in the vault envelope.
struct KdfParams {
    quint64 n = 16384;
    quint64 r = 8;
    quint64 p = 1;

    bool isSane() const;
};

/// AES-256-GCM with a passphrase-derived key. Ciphertext carries the
/// 16-byte tag appended; nonces are 12 bytes and must never repeat per key.
class VaultCipher {
public:
    static constexpr int kKeySize = 32;
    static constexpr int kSaltSize = 16;
    static constexpr int kNonceSize = 12;
    static constexpr int kTagSize = 16;

    VaultCipher() = default;
    ~VaultCipher();

    VaultCipher(const VaultCipher&) = delete;
    VaultCipher& operator=(const VaultCipher&) = delete;

    /// Derive the key from passphrase. Throws IoFailureError if scrypt fails.
    void init(const QString& passphrase, const QByteArray& salt, const KdfParams& params);
    void deinit();
    bool isActive() const { return !key_.isEmpty(); }

    /// Take over other's key; other is left inactive.
    void swap(VaultCipher& other) noexcept;

    QByteArray encrypt(const QByteArray& nonce, const QByteArray& plaintext) const;

    /// False if the tag does not verify (wrong key or tampered data).
    bool decrypt(const QByteArray& nonce, const QByteArray& ciphertext, QByteArray& plaintext) const;

    /// CSPRNG bytes. Throws IoFailureError if the generator is not seeded.
    static QByteArray randomBytes(int count);

private:
    QByteArray key_;
};

} // namespace sigil
