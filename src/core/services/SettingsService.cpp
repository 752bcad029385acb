#include "SettingsService.hpp"
#include "core/Errors.hpp"
#include "core/Resolver.hpp"
#include "core/secrets/SecretChain.hpp"

namespace sigil {

SettingsService::SettingsService(Resolver* resolver, QObject* parent)
    : QObject(parent), resolver_(resolver)
{
}

QVariant SettingsService::value(const QString& key) const
{
    return resolver_->value(key);
}

bool SettingsService::setValue(const QString& key, const QVariant& value)
{
    return setValue(key, value, resolver_->writeTarget());
}

bool SettingsService::setValue(const QString& key, const QVariant& value, const QString& scopeId)
{
    if (!resolver_->set(key, value, scopeId))
        return false;
    emit settingChanged(key, value, scopeId);
    return true;
}

bool SettingsService::clearValue(const QString& key)
{
    const QString scopeId = resolver_->writeTarget();
    if (!resolver_->clear(key, scopeId))
        return false;
    emit settingChanged(key, QVariant(), scopeId);
    return true;
}

QString SettingsService::secret(const QString& key) const
{
    auto chain = resolver_->secretChain();
    if (!chain)
        return {};
    const SecretLookup found = chain->get(key);
    return found.isHit() ? found.value : QString();
}

void SettingsService::setSecret(const QString& key, const QString& value)
{
    auto chain = resolver_->secretChain();
    if (!chain)
        throw NotWritableError(QStringLiteral("No secret store configured"));
    chain->set(key, value);
}

QString SettingsService::effectiveScope(const QString& key) const
{
    return resolver_->effectiveScope(key);
}

void SettingsService::reload()
{
    resolver_->invalidateCache();
}

} // namespace sigil
