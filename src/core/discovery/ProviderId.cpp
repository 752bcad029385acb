#include "ProviderId.hpp"
#include <QRegularExpression>

namespace sigil {

QString normalizeProviderId(const QString& raw)
{
    static const QRegularExpression separators(QStringLiteral("[-_.]+"));
    QString id = raw.trimmed().toLower();
    id.replace(separators, QStringLiteral("-"));
    return id;
}

bool isValidProviderId(const QString& raw)
{
    static const QRegularExpression valid(QStringLiteral("^[a-z0-9]+(-[a-z0-9]+)*$"));
    return valid.match(normalizeProviderId(raw)).hasMatch();
}

QString providerEnvToken(const QString& providerId)
{
    QString token = providerId.toUpper();
    token.replace(QLatin1Char('-'), QLatin1Char('_'));
    token.replace(QLatin1Char('.'), QLatin1Char('_'));
    return token;
}

} // namespace sigil
