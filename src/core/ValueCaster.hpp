#pragma once

#include <QString>
#include <QVariant>
#include <functional>

namespace sigil {

enum class ValueKind {
    Int,
    Float,
    Bool,
    Json,
    String
};

/// Outcome of automatic casting: which parse attempt matched and its value.
struct CastResult {
    ValueKind kind = ValueKind::String;
    QVariant value;
};

/// Explicit caller-supplied conversion. Signals failure by throwing or by
/// returning an invalid QVariant.
using CastFn = std::function<QVariant(const QString& raw)>;

/// Try, in order: integer, float, bool (true/false/yes/no/1/0, any case),
/// JSON array/object. Anything else comes back as the raw string.
CastResult autoCast(const QString& raw);

/// Apply cast to raw for key. Throws CastError carrying key and raw on failure.
QVariant applyCast(const QString& key, const QString& raw, const CastFn& cast);

/// Text stored for a value written through the resolver. Lists and maps
/// become compact JSON, bools "true"/"false".
QString stringifyValue(const QVariant& value);

namespace casts {

// Ready-made explicit casts; each throws std::invalid_argument on mismatch.
QVariant toInt(const QString& raw);       // "5", "5.0" -> 5
QVariant toDouble(const QString& raw);
QVariant toBool(const QString& raw);      // true/false/yes/no/on/off/1/0
QVariant toString(const QString& raw);
QVariant toStringList(const QString& raw); // JSON array or comma separated

} // namespace casts

} // namespace sigil
