#include "ProjectRoot.hpp"
#include <QDir>
#include <QFileInfo>
#include <boost/log/trivial.hpp>

namespace sigil {

QString findProjectRoot(const QString& start, const QStringList& markers)
{
    const QString overrideRoot = qEnvironmentVariable("SIGIL_ROOT");
    if (!overrideRoot.isEmpty())
        return QDir(QDir::cleanPath(overrideRoot)).absolutePath();

    QDir dir(start.isEmpty() ? QDir::currentPath() : start);
    dir.makeAbsolute();
    while (true) {
        for (const auto& marker : markers) {
            if (QFileInfo::exists(dir.filePath(marker))) {
                BOOST_LOG_TRIVIAL(debug) << "Project root: " << dir.absolutePath().toStdString();
                return dir.absolutePath();
            }
        }
        if (!dir.cdUp())
            break;
    }
    return {};
}

} // namespace sigil
