#pragma once

#include "ScopePolicy.hpp"
#include <QMap>
#include <QString>
#include <QStringList>

namespace sigil {

/// What a provider declares about one of its keys.
struct KeyMeta {
    bool hasPrecedence = false;  // precedence below applies to this key only
    PrecedenceMode precedence = PrecedenceMode::ProjectOverUser;
    bool locked = false;         // user scopes may not override it
    bool secret = false;         // stored in the secret chain, not in files
};

/// Per-key metadata shipped next to a provider's defaults file:
///
///   ui.theme:
///     policy: user_over_project
///   build.target:
///     locked: true
///   db.password:
///     secret: true
///
/// Keys absent from the file get a default KeyMeta.
class KeyMetadata {
public:
    KeyMetadata() = default;

    /// Throws NotFoundError for a missing file and CorruptFileError for
    /// unparsable YAML, a non-mapping entry, an unknown policy or a
    /// non-boolean flag.
    static KeyMetadata fromFile(const QString& path);
    static KeyMetadata parse(const QByteArray& yaml, const QString& sourceName);

    /// settings.meta.yaml in the directory of defaultsPath, empty when
    /// defaultsPath is.
    static QString pathBeside(const QString& defaultsPath);

    void insert(const QString& key, const KeyMeta& meta) { entries_.insert(key, meta); }
    KeyMeta lookup(const QString& key) const { return entries_.value(key); }

    bool isEmpty() const { return entries_.isEmpty(); }
    QStringList keys() const { return entries_.keys(); }

private:
    QMap<QString, KeyMeta> entries_;
};

} // namespace sigil
