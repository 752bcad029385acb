#include "EnvSecretProvider.hpp"
#include "core/EnvOverlay.hpp"
#include "core/Errors.hpp"

namespace sigil {

EnvSecretProvider::EnvSecretProvider(const QString& providerId)
    : providerId_(providerId)
{
}

QString EnvSecretProvider::variableFor(const QString& key) const
{
    return envVariableName(QStringLiteral("SIGIL_SECRET_"), providerId_, key);
}

SecretLookup EnvSecretProvider::get(const QString& key)
{
    const QByteArray var = variableFor(key).toLocal8Bit();
    if (!qEnvironmentVariableIsSet(var.constData()))
        return SecretLookup::miss();
    return SecretLookup::hit(qEnvironmentVariable(var.constData()));
}

void EnvSecretProvider::set(const QString& key, const QString&)
{
    throw NotWritableError(QStringLiteral("Environment secrets are read-only (%1)").arg(variableFor(key)));
}

bool EnvSecretProvider::remove(const QString& key)
{
    throw NotWritableError(QStringLiteral("Environment secrets are read-only (%1)").arg(variableFor(key)));
}

} // namespace sigil
