#pragma once

#include "DevLinkRegistry.hpp"
#include "IDefaultsLocator.hpp"
#include "core/Paths.hpp"
#include <QStringList>

namespace sigil {

/// Dev-links first, then installed defaults under each search directory
/// (<dir>/<provider>/.sigil/settings.ini). Pure file lookups.
class DefaultsLocator : public IDefaultsLocator {
public:
    explicit DefaultsLocator(DevLinkRegistry devLinks = DevLinkRegistry(),
                             QStringList searchDirs = Paths::defaultsSearchDirs());

    QString resolveDefaultsPath(const QString& providerId) const override;

    /// Every provider id with a dev-link or an installed defaults file,
    /// sorted and de-duplicated.
    QStringList knownProviders() const;

private:
    DevLinkRegistry devLinks_;
    QStringList searchDirs_;
};

} // namespace sigil
