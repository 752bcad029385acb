#pragma once

#include <QString>
#include <QStringList>

namespace sigil {
namespace Paths {

/// <generic config location>/sigil, e.g. ~/.config/sigil
QString userConfigDir();

/// Directories searched for installed provider defaults, highest priority
/// first. Each holds <provider>/.sigil/settings.ini.
QStringList defaultsSearchDirs();

/// Local host name normalized like a provider id with dashes trimmed;
/// "localhost" when the name is unavailable.
QString hostId();

} // namespace Paths
} // namespace sigil
