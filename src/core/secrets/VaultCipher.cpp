#include "VaultCipher.hpp"
#include "core/Errors.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <memory>

namespace sigil {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

// Upper bound on scrypt memory; N=2^20, r=8 needs 1 GiB, anything past
// that in a vault header is treated as corrupt rather than attempted.
constexpr quint64 kMaxScryptMem = 1100ull * 1024 * 1024;

unsigned char* bytes(QByteArray& data)
{
    return reinterpret_cast<unsigned char*>(data.data());
}

const unsigned char* bytes(const QByteArray& data)
{
    return reinterpret_cast<const unsigned char*>(data.constData());
}

} // namespace

bool KdfParams::isSane() const
{
    if (n < 2 || (n & (n - 1)) != 0 || n > (1ull << 20))
        return false;
    if (r == 0 || r > 32 || p == 0 || p > 16)
        return false;
    return 128 * r * n <= kMaxScryptMem;
}

VaultCipher::~VaultCipher()
{
    deinit();
}

void VaultCipher::init(const QString& passphrase, const QByteArray& salt, const KdfParams& params)
{
    deinit();

    QByteArray pass = passphrase.toUtf8();
    QByteArray key(kKeySize, Qt::Uninitialized);
    const quint64 maxmem = 128 * params.r * params.n + 16ull * 1024 * 1024;
    const int ok = EVP_PBE_scrypt(pass.constData(), static_cast<size_t>(pass.size()),
                                  bytes(salt), static_cast<size_t>(salt.size()),
                                  params.n, params.r, params.p, maxmem,
                                  bytes(key), static_cast<size_t>(key.size()));
    OPENSSL_cleanse(pass.data(), static_cast<size_t>(pass.size()));
    if (ok != 1) {
        OPENSSL_cleanse(key.data(), static_cast<size_t>(key.size()));
        throw IoFailureError(QStringLiteral("scrypt key derivation failed"));
    }
    key_ = key;
}

void VaultCipher::deinit()
{
    if (!key_.isEmpty()) {
        OPENSSL_cleanse(key_.data(), static_cast<size_t>(key_.size()));
        key_.clear();
    }
}

void VaultCipher::swap(VaultCipher& other) noexcept
{
    key_.swap(other.key_);
}

QByteArray VaultCipher::encrypt(const QByteArray& nonce, const QByteArray& plaintext) const
{
    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx)
        throw IoFailureError(QStringLiteral("EVP_CIPHER_CTX_new failed"));

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, nonce.size(), nullptr) != 1
        || EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, bytes(key_), bytes(nonce)) != 1)
        throw IoFailureError(QStringLiteral("AES-GCM init failed"));

    QByteArray out(plaintext.size() + kTagSize, Qt::Uninitialized);
    int len = 0;
    int total = 0;
    if (EVP_EncryptUpdate(ctx.get(), bytes(out), &len, bytes(plaintext), plaintext.size()) != 1)
        throw IoFailureError(QStringLiteral("AES-GCM encrypt failed"));
    total = len;
    if (EVP_EncryptFinal_ex(ctx.get(), bytes(out) + total, &len) != 1)
        throw IoFailureError(QStringLiteral("AES-GCM finalize failed"));
    total += len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagSize, bytes(out) + total) != 1)
        throw IoFailureError(QStringLiteral("AES-GCM tag extraction failed"));

    out.resize(total + kTagSize);
    return out;
}

bool VaultCipher::decrypt(const QByteArray& nonce, const QByteArray& ciphertext, QByteArray& plaintext) const
{
    if (ciphertext.size() < kTagSize || nonce.size() != kNonceSize)
        return false;

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx)
        throw IoFailureError(QStringLiteral("EVP_CIPHER_CTX_new failed"));

    const int bodySize = ciphertext.size() - kTagSize;
    QByteArray tag = ciphertext.right(kTagSize);

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, nonce.size(), nullptr) != 1
        || EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, bytes(key_), bytes(nonce)) != 1)
        throw IoFailureError(QStringLiteral("AES-GCM init failed"));

    QByteArray out(bodySize, Qt::Uninitialized);
    int len = 0;
    if (EVP_DecryptUpdate(ctx.get(), bytes(out), &len, bytes(ciphertext), bodySize) != 1)
        return false;
    int total = len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagSize, bytes(tag)) != 1)
        return false;
    if (EVP_DecryptFinal_ex(ctx.get(), bytes(out) + total, &len) != 1) {
        OPENSSL_cleanse(out.data(), static_cast<size_t>(out.size()));
        return false;
    }
    total += len;
    out.resize(total);
    plaintext = out;
    return true;
}

QByteArray VaultCipher::randomBytes(int count)
{
    QByteArray out(count, Qt::Uninitialized);
    if (RAND_bytes(bytes(out), count) != 1)
        throw IoFailureError(QStringLiteral("RAND_bytes failed"));
    return out;
}

} // namespace sigil
