#include "SecretChain.hpp"
#include "EnvSecretProvider.hpp"
#include "KeyringProvider.hpp"
#include "VaultProvider.hpp"
#include "core/Errors.hpp"
#include <boost/log/trivial.hpp>

namespace sigil {

SecretChain::SecretChain(std::vector<std::shared_ptr<ISecretProvider>> providers)
    : providers_(std::move(providers))
{
}

std::shared_ptr<SecretChain> SecretChain::standard(const QString& providerId, const QString& vaultPath)
{
    std::vector<std::shared_ptr<ISecretProvider>> providers;
    providers.push_back(std::make_shared<KeyringProvider>());
    providers.push_back(std::make_shared<VaultProvider>(vaultPath));
    providers.push_back(std::make_shared<EnvSecretProvider>(providerId));
    return std::make_shared<SecretChain>(std::move(providers));
}

// A backend that throws (keyring daemon went away mid-call, broken bus) is a
// soft failure for the chain: log it and move on as Unavailable.
SecretLookup SecretChain::ask(ISecretProvider& provider, const QString& key)
{
    if (!provider.isAvailable())
        return SecretLookup::unavailable(QStringLiteral("not available"));
    try {
        return provider.get(key);
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "SecretChain: provider " << provider.name().toStdString()
                                   << " failed: " << e.what();
        return SecretLookup::unavailable(QString::fromUtf8(e.what()));
    }
}

SecretLookup SecretChain::get(const QString& key) const
{
    for (const auto& p : providers_) {
        SecretLookup result = ask(*p, key);
        switch (result.status) {
        case SecretLookup::Status::Hit:
            BOOST_LOG_TRIVIAL(debug) << "SecretChain: " << key.toStdString()
                                     << " found in " << p->name().toStdString();
            return result;
        case SecretLookup::Status::Miss:
            break;
        case SecretLookup::Status::Unavailable:
        case SecretLookup::Status::Locked:
            BOOST_LOG_TRIVIAL(debug) << "SecretChain: skipping " << p->name().toStdString()
                                     << " (" << result.reason.toStdString() << ")";
            break;
        }
    }
    BOOST_LOG_TRIVIAL(debug) << "SecretChain: " << key.toStdString() << " not found";
    return SecretLookup::miss();
}

SecretLookup SecretChain::get(const QString& key, const QString& providerName) const
{
    auto p = provider(providerName);
    if (!p)
        throw UnknownScopeError(providerName);

    SecretLookup result = ask(*p, key);
    if (result.status == SecretLookup::Status::Locked)
        throw VaultLockedError(QStringLiteral("%1 is locked: %2").arg(providerName, result.reason));
    return result;
}

std::shared_ptr<ISecretProvider> SecretChain::writeTarget(const QString& key, const QString& providerName) const
{
    if (!providerName.isEmpty()) {
        auto p = provider(providerName);
        if (!p)
            throw UnknownScopeError(providerName);
        if (!p->supportsWrite())
            throw NotWritableError(QStringLiteral("Secret provider '%1' is read-only").arg(providerName));
        return p;
    }

    for (const auto& p : providers_) {
        if (p->isAvailable() && p->supportsWrite())
            return p;
    }
    throw NotWritableError(QStringLiteral("No write-capable secret provider for '%1'").arg(key));
}

void SecretChain::set(const QString& key, const QString& value, const QString& providerName)
{
    auto p = writeTarget(key, providerName);
    p->set(key, value);
    BOOST_LOG_TRIVIAL(info) << "SecretChain: stored " << key.toStdString()
                            << " in " << p->name().toStdString();
}

bool SecretChain::remove(const QString& key, const QString& providerName)
{
    auto p = writeTarget(key, providerName);
    const bool removed = p->remove(key);
    if (removed)
        BOOST_LOG_TRIVIAL(info) << "SecretChain: removed " << key.toStdString()
                                << " from " << p->name().toStdString();
    return removed;
}

bool SecretChain::isAvailable() const
{
    for (const auto& p : providers_) {
        if (p->isAvailable())
            return true;
    }
    return false;
}

bool SecretChain::canWrite() const
{
    for (const auto& p : providers_) {
        if (p->isAvailable() && p->supportsWrite())
            return true;
    }
    return false;
}

QStringList SecretChain::providerNames() const
{
    QStringList names;
    for (const auto& p : providers_)
        names.append(p->name());
    return names;
}

std::shared_ptr<ISecretProvider> SecretChain::provider(const QString& name) const
{
    for (const auto& p : providers_) {
        if (p->name() == name)
            return p;
    }
    return nullptr;
}

std::shared_ptr<VaultProvider> SecretChain::vault() const
{
    for (const auto& p : providers_) {
        if (auto v = std::dynamic_pointer_cast<VaultProvider>(p))
            return v;
    }
    return nullptr;
}

} // namespace sigil
