#include "JsonBackend.hpp"
#include "core/AtomicFile.hpp"
#include "core/Errors.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <boost/log/trivial.hpp>

namespace sigil {

static void flattenObject(const QJsonObject& obj, const QString& prefix, Mapping& out)
{
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        const QString key = prefix.isEmpty() ? it.key() : prefix + QLatin1Char('.') + it.key();
        const QJsonValue v = it.value();
        switch (v.type()) {
        case QJsonValue::Object:
            flattenObject(v.toObject(), key, out);
            break;
        case QJsonValue::Array:
            out.insert(key, QString::fromUtf8(QJsonDocument(v.toArray()).toJson(QJsonDocument::Compact)));
            break;
        case QJsonValue::Bool:
            out.insert(key, v.toBool() ? QStringLiteral("true") : QStringLiteral("false"));
            break;
        case QJsonValue::Double:
            out.insert(key, v.toVariant().toString());
            break;
        case QJsonValue::String:
            out.insert(key, v.toString());
            break;
        default:
            out.insert(key, QString());
            break;
        }
    }
}

// Insert value at the dotted path, creating intermediate objects.
static bool insertPath(QJsonObject& obj, const QStringList& parts, int index, const QString& value)
{
    const QString& part = parts[index];
    if (index == parts.size() - 1) {
        if (obj.value(part).isObject())
            return false;
        obj.insert(part, value);
        return true;
    }
    QJsonValue existing = obj.value(part);
    if (!existing.isUndefined() && !existing.isObject())
        return false;
    QJsonObject child = existing.toObject();
    if (!insertPath(child, parts, index + 1, value))
        return false;
    obj.insert(part, child);
    return true;
}

Mapping JsonBackend::load(const QString& path) const
{
    const QByteArray text = readWholeFile(path);
    if (text.trimmed().isEmpty())
        return {};

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(text, &err);
    if (err.error != QJsonParseError::NoError) {
        BOOST_LOG_TRIVIAL(error) << "JsonBackend: failed to parse " << path.toStdString()
                                 << ": " << err.errorString().toStdString();
        throw CorruptFileError(path, err.errorString());
    }
    if (!doc.isObject())
        throw CorruptFileError(path, QStringLiteral("root of a settings document must be an object"));

    Mapping data;
    flattenObject(doc.object(), QString(), data);
    return data;
}

void JsonBackend::save(const QString& path, const Mapping& data) const
{
    QJsonObject root;
    for (auto it = data.constBegin(); it != data.constEnd(); ++it) {
        if (!insertPath(root, it.key().split(QLatin1Char('.')), 0, it.value()))
            throw UnsupportedFormatError(
                QStringLiteral("'%1' is both a value and a section; JSON cannot store it (%2)").arg(it.key(), path));
    }
    writeFileAtomically(path, QJsonDocument(root).toJson(QJsonDocument::Indented));
}

} // namespace sigil
