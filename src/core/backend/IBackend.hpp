#pragma once

#include "core/Mapping.hpp"
#include <QString>
#include <QStringList>

namespace sigil {

/// Load/save implementation for one on-disk format holding a flat mapping.
class IBackend {
public:
    virtual ~IBackend() = default;

    /// Short format name for log output ("ini", "yaml", ...).
    virtual QString name() const = 0;

    /// File suffixes (without dot) this backend handles by default.
    virtual QStringList suffixes() const = 0;

    /// Parse the file at path.
    /// Throws NotFoundError if the file or its directory is missing,
    /// CorruptFileError if the file exists but cannot be parsed.
    virtual Mapping load(const QString& path) const = 0;

    /// Replace the file at path with data. Atomic, creates parent directories.
    /// Throws IoFailureError on write failure.
    virtual void save(const QString& path, const Mapping& data) const = 0;
};

} // namespace sigil
