#pragma once

#include <QString>
#include <QStringList>

namespace sigil {

/// Nearest ancestor of start (inclusive) containing one of markers.
/// SIGIL_ROOT, when set, wins over the search. Returns an empty string when
/// no root is found. start defaults to the current directory.
QString findProjectRoot(const QString& start = {},
                        const QStringList& markers = {QStringLiteral(".sigil"), QStringLiteral(".git")});

} // namespace sigil
