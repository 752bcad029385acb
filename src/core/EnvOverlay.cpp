#include "core/EnvOverlay.hpp"
#include "core/discovery/ProviderId.hpp"

namespace sigil {

static const QString kEnvPrefix = QStringLiteral("SIGIL_");

Mapping readEnv(const QString& providerId)
{
    return readEnv(providerId, QProcessEnvironment::systemEnvironment());
}

Mapping readEnv(const QString& providerId, const QProcessEnvironment& env)
{
    const QString prefix = kEnvPrefix + providerEnvToken(providerId) + QLatin1Char('_');
    Mapping result;
    for (const auto& name : env.keys()) {
        if (!name.startsWith(prefix) || name.size() == prefix.size())
            continue;

        QString key = name.mid(prefix.size()).toLower();
        if (key.contains(QLatin1String("__"))) {
            key.replace(QLatin1String("__"), QLatin1String("."));
        } else {
            const int sep = key.indexOf(QLatin1Char('_'));
            if (sep > 0 && sep < key.size() - 1)
                key[sep] = QLatin1Char('.');
        }
        if (!isValidKey(key))
            continue;
        result.insert(key, env.value(name));
    }
    return result;
}

QString envVariableName(const QString& prefix, const QString& providerId, const QString& dottedKey)
{
    QString key = dottedKey;
    key.replace(QLatin1Char('.'), QLatin1Char('_'));
    return (prefix + providerEnvToken(providerId) + QLatin1Char('_') + key).toUpper();
}

} // namespace sigil
