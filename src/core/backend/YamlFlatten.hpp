#pragma once

#include "core/Mapping.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

namespace sigil {

// Flatten: nested mappings become dotted keys, scalars keep their text,
// sequences and other non-map nodes are kept as flow-style YAML text.
inline void flattenYaml(const YAML::Node& node, const QString& prefix, Mapping& out)
{
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            const auto key = QString::fromStdString(it->first.as<std::string>());
            flattenYaml(it->second, prefix.isEmpty() ? key : prefix + QLatin1Char('.') + key, out);
        }
        return;
    }

    if (prefix.isEmpty())
        return;

    if (node.IsScalar()) {
        out.insert(prefix, QString::fromStdString(node.Scalar()));
    } else if (node.IsNull()) {
        out.insert(prefix, QString());
    } else {
        YAML::Emitter emitter;
        emitter << YAML::Flow << node;
        out.insert(prefix, QString::fromUtf8(emitter.c_str()));
    }
}

// Inverse of flattenYaml: "db.host" -> root["db"]["host"].
// Returns false and leaves conflictKey set when a key is both a leaf and a
// parent ("a" and "a.b"), which a YAML tree cannot represent.
inline bool buildYaml(const Mapping& flat, YAML::Node& root, QString& conflictKey)
{
    root = YAML::Node(YAML::NodeType::Map);
    for (auto it = flat.constBegin(); it != flat.constEnd(); ++it) {
        const QStringList parts = it.key().split(QLatin1Char('.'));
        YAML::Node node = root;
        for (int i = 0; i < parts.size() - 1; ++i) {
            const std::string part = parts[i].toStdString();
            YAML::Node child = node[part];
            if (child.IsDefined() && !child.IsMap()) {
                conflictKey = it.key();
                return false;
            }
            if (!child.IsDefined())
                node[part] = YAML::Node(YAML::NodeType::Map);
            node.reset(node[part]);
        }
        const std::string leaf = parts.last().toStdString();
        if (node[leaf].IsMap()) {
            conflictKey = it.key();
            return false;
        }
        node[leaf] = it.value().toStdString();
    }
    return true;
}

} // namespace sigil
