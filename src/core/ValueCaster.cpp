#include "core/ValueCaster.hpp"
#include "core/Errors.hpp"
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStringList>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace sigil {

namespace {

using ParseAttempt = bool (*)(const QString& text, QVariant& out);

bool parseInt(const QString& text, QVariant& out)
{
    bool ok = false;
    const qlonglong v = text.toLongLong(&ok);
    if (!ok)
        return false;
    if (v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max())
        out = static_cast<int>(v);
    else
        out = v;
    return true;
}

bool parseFloat(const QString& text, QVariant& out)
{
    bool ok = false;
    const double v = text.toDouble(&ok);
    if (!ok)
        return false;
    out = v;
    return true;
}

bool parseBool(const QString& text, QVariant& out)
{
    const QString lower = text.toLower();
    if (lower == QLatin1String("true") || lower == QLatin1String("yes") || lower == QLatin1String("1")) {
        out = true;
        return true;
    }
    if (lower == QLatin1String("false") || lower == QLatin1String("no") || lower == QLatin1String("0")) {
        out = false;
        return true;
    }
    return false;
}

bool parseJson(const QString& text, QVariant& out)
{
    if (!text.startsWith(QLatin1Char('[')) && !text.startsWith(QLatin1Char('{')))
        return false;
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError)
        return false;
    out = doc.toVariant();
    return true;
}

struct Attempt {
    ValueKind kind;
    ParseAttempt parse;
};

// Order matters: "1" is an int, not a bool; "1.5" a float, not a string.
const Attempt kAttempts[] = {
    {ValueKind::Int, parseInt},
    {ValueKind::Float, parseFloat},
    {ValueKind::Bool, parseBool},
    {ValueKind::Json, parseJson},
};

} // namespace

CastResult autoCast(const QString& raw)
{
    const QString text = raw.trimmed();
    if (!text.isEmpty()) {
        for (const auto& attempt : kAttempts) {
            QVariant v;
            if (attempt.parse(text, v))
                return {attempt.kind, v};
        }
    }
    return {ValueKind::String, raw};
}

QVariant applyCast(const QString& key, const QString& raw, const CastFn& cast)
{
    QVariant result;
    try {
        result = cast(raw);
    } catch (const std::exception& e) {
        throw CastError(key, raw, QString::fromUtf8(e.what()));
    }
    if (!result.isValid())
        throw CastError(key, raw, QStringLiteral("conversion produced no value"));
    return result;
}

QString stringifyValue(const QVariant& value)
{
    switch (value.metaType().id()) {
    case QMetaType::Bool:
        return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QMetaType::QVariantList:
    case QMetaType::QStringList:
    case QMetaType::QVariantMap:
    case QMetaType::QVariantHash:
        return QString::fromUtf8(QJsonDocument::fromVariant(value).toJson(QJsonDocument::Compact));
    default:
        return value.toString();
    }
}

namespace casts {

QVariant toInt(const QString& raw)
{
    const QString text = raw.trimmed();
    bool ok = false;
    const int v = text.toInt(&ok);
    if (ok)
        return v;
    const double d = text.toDouble(&ok);
    if (ok && std::isfinite(d) && d == std::floor(d)
        && d >= std::numeric_limits<int>::min() && d <= std::numeric_limits<int>::max())
        return static_cast<int>(d);
    throw std::invalid_argument("not an integer");
}

QVariant toDouble(const QString& raw)
{
    bool ok = false;
    const double v = raw.trimmed().toDouble(&ok);
    if (!ok)
        throw std::invalid_argument("not a number");
    return v;
}

QVariant toBool(const QString& raw)
{
    const QString lower = raw.trimmed().toLower();
    if (lower == QLatin1String("on"))
        return true;
    if (lower == QLatin1String("off"))
        return false;
    QVariant v;
    if (!parseBool(lower, v))
        throw std::invalid_argument("not a boolean");
    return v;
}

QVariant toString(const QString& raw)
{
    return raw;
}

QVariant toStringList(const QString& raw)
{
    const QString text = raw.trimmed();
    if (text.isEmpty())
        return QStringList();
    if (text.startsWith(QLatin1Char('['))) {
        QJsonParseError err;
        const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &err);
        if (err.error != QJsonParseError::NoError || !doc.isArray())
            throw std::invalid_argument("malformed JSON array");
        return doc.toVariant().toStringList();
    }
    QStringList items;
    for (const auto& part : text.split(QLatin1Char(',')))
        items.append(part.trimmed());
    return items;
}

} // namespace casts

} // namespace sigil
