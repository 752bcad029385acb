#pragma once

#include <QString>

namespace sigil {

/// Result of asking one secret backend for a key. The chain scans these as
/// plain data: anything but Hit moves on to the next provider.
struct SecretLookup {
    enum class Status {
        Hit,
        Miss,
        Unavailable,  // backend cannot be used right now (no keyring, no bus)
        Locked        // backend is present but needs unlocking first
    };

    Status status = Status::Miss;
    QString value;
    QString reason;

    bool isHit() const { return status == Status::Hit; }

    static SecretLookup hit(const QString& value) { return {Status::Hit, value, {}}; }
    static SecretLookup miss() { return {Status::Miss, {}, {}}; }
    static SecretLookup unavailable(const QString& why) { return {Status::Unavailable, {}, why}; }
    static SecretLookup locked(const QString& why) { return {Status::Locked, {}, why}; }
};

class ISecretProvider {
public:
    virtual ~ISecretProvider() = default;

    virtual QString name() const = 0;

    /// Whether the backend can be consulted at all in this process.
    virtual bool isAvailable() const = 0;

    /// Whether set() can ever succeed on this backend.
    virtual bool supportsWrite() const = 0;

    virtual SecretLookup get(const QString& key) = 0;

    /// Store value. Throws on failure (NotWritableError, VaultLockedError,
    /// IoFailureError).
    virtual void set(const QString& key, const QString& value) = 0;

    /// Delete key. Returns false when it was not stored. Throws like set().
    virtual bool remove(const QString& key) = 0;
};

} // namespace sigil
