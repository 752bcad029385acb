#pragma once

#include "IBackend.hpp"

namespace sigil {

/// Sectioned key=value text.
///
///   [db]
///   host = localhost
///   port = 5432
///
/// Dotted key "db.host" is stored as section "db", key "host". Keys with no
/// dot live under [__root__]. Lines starting with '#' or ';' are comments.
/// Keys are case-sensitive. Output is sorted so equal mappings produce
/// byte-identical files.
class IniBackend : public IBackend {
public:
    QString name() const override { return QStringLiteral("ini"); }
    QStringList suffixes() const override { return {QStringLiteral("ini")}; }

    Mapping load(const QString& path) const override;
    void save(const QString& path, const Mapping& data) const override;

    /// Parse INI text. sourceName is used in error messages only.
    static Mapping parse(const QByteArray& text, const QString& sourceName);
    static QByteArray serialize(const Mapping& data);
};

} // namespace sigil
