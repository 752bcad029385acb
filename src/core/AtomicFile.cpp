#include "core/AtomicFile.hpp"
#include "core/Errors.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

namespace sigil {

void writeFileAtomically(const QString& path, const QByteArray& data)
{
    QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath()))
        throw IoFailureError(QStringLiteral("Cannot create directory %1").arg(info.absolutePath()));

    // QSaveFile writes <path>.XXXXXX beside the target and renames on commit().
    // Destroying it without commit() discards the temp file.
    QSaveFile out(path);
    if (!out.open(QIODevice::WriteOnly))
        throw IoFailureError(QStringLiteral("Cannot open %1 for writing: %2").arg(path, out.errorString()));

    if (out.write(data) != data.size()) {
        out.cancelWriting();
        throw IoFailureError(QStringLiteral("Short write to %1: %2").arg(path, out.errorString()));
    }

    if (!out.commit())
        throw IoFailureError(QStringLiteral("Cannot replace %1: %2").arg(path, out.errorString()));
}

QByteArray readWholeFile(const QString& path)
{
    QFile in(path);
    if (!in.exists())
        throw NotFoundError(QStringLiteral("%1 does not exist").arg(path));
    if (!in.open(QIODevice::ReadOnly))
        throw IoFailureError(QStringLiteral("Cannot open %1: %2").arg(path, in.errorString()));
    return in.readAll();
}

} // namespace sigil
