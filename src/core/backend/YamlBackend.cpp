#include "YamlBackend.hpp"
#include "YamlFlatten.hpp"
#include "core/AtomicFile.hpp"
#include "core/Errors.hpp"
#include <boost/log/trivial.hpp>

namespace sigil {

Mapping YamlBackend::load(const QString& path) const
{
    const QByteArray text = readWholeFile(path);
    if (text.trimmed().isEmpty())
        return {};

    YAML::Node root;
    try {
        root = YAML::Load(text.toStdString());
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(error) << "YamlBackend: failed to parse " << path.toStdString()
                                 << ": " << e.what();
        throw CorruptFileError(path, QString::fromStdString(e.what()));
    }

    if (root.IsNull())
        return {};
    if (!root.IsMap())
        throw CorruptFileError(path, QStringLiteral("root of a settings document must be a mapping"));

    Mapping data;
    flattenYaml(root, QString(), data);
    return data;
}

void YamlBackend::save(const QString& path, const Mapping& data) const
{
    YAML::Node root;
    QString conflict;
    if (!buildYaml(data, root, conflict))
        throw UnsupportedFormatError(
            QStringLiteral("'%1' is both a value and a section; YAML cannot store it (%2)").arg(conflict, path));

    YAML::Emitter out;
    out << root;
    QByteArray bytes(out.c_str());
    bytes.append('\n');
    writeFileAtomically(path, bytes);
}

} // namespace sigil
