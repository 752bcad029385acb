#pragma once

#include <QByteArray>
#include <QString>

namespace sigil {

/// Whole-file writes that a concurrent reader sees either fully old or fully new.
/// Data goes to a temporary file in the target directory, is flushed, then
/// renamed over the target. Missing parent directories are created.
/// Throws IoFailureError when any step fails; the target is left untouched.
void writeFileAtomically(const QString& path, const QByteArray& data);

/// Read a whole file. Throws NotFoundError if it (or its directory) is absent,
/// IoFailureError if it exists but cannot be opened.
QByteArray readWholeFile(const QString& path);

} // namespace sigil
