#pragma once

#include "IBackend.hpp"

namespace sigil {

/// YAML document whose nested mappings flatten to dotted keys.
/// The root must be a mapping (or empty).
class YamlBackend : public IBackend {
public:
    QString name() const override { return QStringLiteral("yaml"); }
    QStringList suffixes() const override { return {QStringLiteral("yaml"), QStringLiteral("yml")}; }

    Mapping load(const QString& path) const override;
    void save(const QString& path, const Mapping& data) const override;
};

} // namespace sigil
