#pragma once

#include "IBackend.hpp"
#include <QMap>
#include <QReadWriteLock>
#include <QString>
#include <memory>

namespace sigil {

/// Maps a file suffix to the backend that reads and writes it.
/// New formats are added with registerBackend(); the resolver only ever
/// talks to IBackend, so it needs no change for a new format.
class BackendRegistry {
public:
    BackendRegistry() = default;

    /// Registry preloaded with the INI, YAML and JSON backends.
    static std::shared_ptr<BackendRegistry> withBuiltins();

    /// Register backend for suffix ("ini" or ".ini", case-insensitive).
    /// A later registration for the same suffix replaces the earlier one.
    void registerBackend(const QString& suffix, std::shared_ptr<const IBackend> backend);

    /// Register backend under every suffix it reports.
    void registerBackend(std::shared_ptr<const IBackend> backend);

    bool supports(const QString& path) const;

    /// Throws UnsupportedFormatError when no backend handles the path's suffix.
    std::shared_ptr<const IBackend> backendForPath(const QString& path) const;

    QStringList registeredSuffixes() const;

private:
    static QString normalizeSuffix(const QString& suffix);

    mutable QReadWriteLock lock_;
    QMap<QString, std::shared_ptr<const IBackend>> backends_;
};

} // namespace sigil
