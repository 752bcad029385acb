#include "KeyMetadata.hpp"
#include "core/AtomicFile.hpp"
#include "core/Errors.hpp"
#include "core/Mapping.hpp"
#include "core/ValueCaster.hpp"
#include <QDir>
#include <QFileInfo>
#include <yaml-cpp/yaml.h>
#include <boost/log/trivial.hpp>
#include <string>

namespace sigil {

static const QString kMetaFileName = QStringLiteral("settings.meta.yaml");

KeyMetadata KeyMetadata::fromFile(const QString& path)
{
    const QByteArray text = readWholeFile(path);
    try {
        return parse(text, path);
    } catch (const CorruptFileError& e) {
        BOOST_LOG_TRIVIAL(error) << "KeyMetadata: " << e.what();
        throw;
    }
}

KeyMetadata KeyMetadata::parse(const QByteArray& yaml, const QString& sourceName)
{
    KeyMetadata meta;
    if (yaml.trimmed().isEmpty())
        return meta;

    YAML::Node root;
    try {
        root = YAML::Load(yaml.toStdString());
    } catch (const YAML::Exception& e) {
        throw CorruptFileError(sourceName, QString::fromStdString(e.what()));
    }
    if (root.IsNull())
        return meta;
    if (!root.IsMap())
        throw CorruptFileError(sourceName, QStringLiteral("metadata root must be a mapping of keys"));

    for (auto it = root.begin(); it != root.end(); ++it) {
        const QString key = QString::fromStdString(it->first.as<std::string>(""));
        if (!isValidKey(key))
            throw CorruptFileError(sourceName, QStringLiteral("malformed key '%1'").arg(key));
        const YAML::Node entry = it->second;
        if (!entry.IsMap())
            throw CorruptFileError(sourceName, QStringLiteral("entry for '%1' must be a mapping").arg(key));

        KeyMeta m;
        if (entry["policy"]) {
            const QString text = QString::fromStdString(entry["policy"].as<std::string>(""));
            if (!parsePrecedenceMode(text, m.precedence))
                throw CorruptFileError(sourceName, QStringLiteral("unknown policy '%1' for '%2'").arg(text, key));
            m.hasPrecedence = true;
        }

        try {
            if (entry["locked"])
                m.locked = applyCast(key, QString::fromStdString(entry["locked"].as<std::string>("")),
                                     casts::toBool).toBool();
            if (entry["secret"])
                m.secret = applyCast(key, QString::fromStdString(entry["secret"].as<std::string>("")),
                                     casts::toBool).toBool();
        } catch (const CastError& e) {
            throw CorruptFileError(sourceName, QString::fromUtf8(e.what()));
        }

        meta.insert(key, m);
    }

    BOOST_LOG_TRIVIAL(debug) << "KeyMetadata: " << meta.entries_.size() << " entries from "
                             << sourceName.toStdString();
    return meta;
}

QString KeyMetadata::pathBeside(const QString& defaultsPath)
{
    if (defaultsPath.isEmpty())
        return QString();
    return QFileInfo(defaultsPath).dir().filePath(kMetaFileName);
}

} // namespace sigil
