#pragma once

#include "ISecretProvider.hpp"
#include <QStringList>
#include <memory>
#include <vector>

namespace sigil {

class VaultProvider;

/// Ordered secret backends, highest trust first.
///
/// get() returns the first Hit; Miss, Unavailable and Locked fall through
/// to the next provider. set() goes to the first available provider that
/// supports writing, unless a provider is pinned by name.
class SecretChain {
public:
    explicit SecretChain(std::vector<std::shared_ptr<ISecretProvider>> providers);

    /// Keyring, encrypted vault at vaultPath, then SIGIL_SECRET_* variables.
    static std::shared_ptr<SecretChain> standard(const QString& providerId, const QString& vaultPath);

    /// First hit in chain order, or Miss.
    SecretLookup get(const QString& key) const;

    /// Ask only providerName. Throws VaultLockedError if it is locked and
    /// UnknownScopeError if no provider has that name.
    SecretLookup get(const QString& key, const QString& providerName) const;

    /// Throws NotWritableError when nothing can take the write.
    void set(const QString& key, const QString& value, const QString& providerName = {});

    /// Delete key from the provider set() would write to (or providerName).
    /// Returns false when it held no such key. Throws NotWritableError when
    /// nothing can take the write.
    bool remove(const QString& key, const QString& providerName = {});

    bool isAvailable() const;
    bool canWrite() const;

    QStringList providerNames() const;
    std::shared_ptr<ISecretProvider> provider(const QString& name) const;

    /// The first vault in the chain, or nullptr.
    std::shared_ptr<VaultProvider> vault() const;

private:
    static SecretLookup ask(ISecretProvider& provider, const QString& key);
    std::shared_ptr<ISecretProvider> writeTarget(const QString& key, const QString& providerName) const;

    std::vector<std::shared_ptr<ISecretProvider>> providers_;
};

} // namespace sigil
