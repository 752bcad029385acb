#pragma once

#include <QMap>
#include <QString>
#include <QStringList>

namespace sigil {

/// Flat scope contents: dotted key ("db.host") -> raw value text.
/// QMap keeps iteration sorted, so equal mappings always serialize identically.
using Mapping = QMap<QString, QString>;

/// Section name used for keys that have no dot.
inline constexpr const char* kRootSection = "__root__";

/// Split "db.host" into {"db", "host"}; "a.b.c" into {"a", "b.c"}.
/// A key without a dot yields {kRootSection, key}.
inline QStringList splitSectionKey(const QString& dottedKey)
{
    int dot = dottedKey.indexOf(QLatin1Char('.'));
    if (dot < 0)
        return {QString::fromLatin1(kRootSection), dottedKey};
    return {dottedKey.left(dot), dottedKey.mid(dot + 1)};
}

inline QString joinSectionKey(const QString& section, const QString& key)
{
    if (section == QLatin1String(kRootSection))
        return key;
    return section + QLatin1Char('.') + key;
}

/// A usable key is non-empty and every dotted segment is non-empty, has no
/// surrounding whitespace, contains none of "=[]" or control characters, and
/// does not start with a comment marker ('#' or ';'). Every backend can store
/// such a key and read it back unchanged.
inline bool isValidKey(const QString& dottedKey)
{
    if (dottedKey.isEmpty())
        return false;
    const auto parts = dottedKey.split(QLatin1Char('.'));
    for (const auto& p : parts) {
        if (p.isEmpty() || p != p.trimmed())
            return false;
        if (p.startsWith(QLatin1Char('#')) || p.startsWith(QLatin1Char(';')))
            return false;
        for (QChar c : p) {
            if (c == QLatin1Char('=') || c == QLatin1Char('[') || c == QLatin1Char(']') || c.category() == QChar::Other_Control)
                return false;
        }
    }
    return true;
}

} // namespace sigil
