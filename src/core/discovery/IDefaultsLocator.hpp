#pragma once

#include <QString>

namespace sigil {

/// Finds the defaults file a provider ships.
class IDefaultsLocator {
public:
    virtual ~IDefaultsLocator() = default;

    /// Absolute path to the provider's defaults file, or an empty string when
    /// none is known. Not finding one is normal and means "no defaults".
    virtual QString resolveDefaultsPath(const QString& providerId) const = 0;
};

} // namespace sigil
