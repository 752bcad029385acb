#pragma once

#include "IBackend.hpp"

namespace sigil {

/// JSON object of objects: {"db": {"host": "localhost"}} <-> db.host.
/// Values are written as JSON strings; on load numbers and booleans are
/// converted to their text form and arrays to compact JSON.
class JsonBackend : public IBackend {
public:
    QString name() const override { return QStringLiteral("json"); }
    QStringList suffixes() const override { return {QStringLiteral("json")}; }

    Mapping load(const QString& path) const override;
    void save(const QString& path, const Mapping& data) const override;
};

} // namespace sigil
