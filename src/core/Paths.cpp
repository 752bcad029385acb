#include "core/Paths.hpp"
#include "core/discovery/ProviderId.hpp"
#include <QDir>
#include <QStandardPaths>
#include <QSysInfo>

namespace sigil {
namespace Paths {

QString userConfigDir()
{
    return QDir(QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation))
        .filePath(QStringLiteral("sigil"));
}

QStringList defaultsSearchDirs()
{
    QStringList dirs;
    for (const auto& base : QStandardPaths::standardLocations(QStandardPaths::GenericDataLocation))
        dirs.append(QDir(base).filePath(QStringLiteral("sigil/providers")));
    return dirs;
}

QString hostId()
{
    QString id = normalizeProviderId(QSysInfo::machineHostName());
    while (id.startsWith(QLatin1Char('-')))
        id.remove(0, 1);
    while (id.endsWith(QLatin1Char('-')))
        id.chop(1);
    return id.isEmpty() ? QStringLiteral("localhost") : id;
}

} // namespace Paths
} // namespace sigil
