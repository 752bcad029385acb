#include "DevLinkRegistry.hpp"
#include "ProviderId.hpp"
#include "core/AtomicFile.hpp"
#include "core/Errors.hpp"
#include "core/Paths.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <boost/log/trivial.hpp>

namespace sigil {

static const QString kLinkSuffix = QStringLiteral(".link");

DevLinkRegistry::DevLinkRegistry(const QString& linksDir)
    : linksDir_(linksDir)
{
}

QString DevLinkRegistry::defaultLinksDir()
{
    return QDir(Paths::userConfigDir()).filePath(QStringLiteral("dev-links"));
}

QString DevLinkRegistry::linkFile(const QString& providerId) const
{
    return QDir(linksDir_).filePath(normalizeProviderId(providerId) + kLinkSuffix);
}

void DevLinkRegistry::link(const QString& providerId, const QString& defaultsPath)
{
    QFileInfo info(defaultsPath);
    if (!info.isFile())
        throw NotFoundError(QStringLiteral("Defaults file %1 does not exist").arg(defaultsPath));

    const QString absolute = info.absoluteFilePath();
    writeFileAtomically(linkFile(providerId), absolute.toUtf8() + '\n');
    BOOST_LOG_TRIVIAL(info) << "Dev-link: " << normalizeProviderId(providerId).toStdString()
                            << " -> " << absolute.toStdString();
}

bool DevLinkRegistry::unlink(const QString& providerId)
{
    QFile file(linkFile(providerId));
    if (!file.exists())
        return false;
    if (!file.remove())
        throw IoFailureError(QStringLiteral("Cannot remove %1: %2").arg(file.fileName(), file.errorString()));
    BOOST_LOG_TRIVIAL(info) << "Dev-link removed: " << normalizeProviderId(providerId).toStdString();
    return true;
}

QString DevLinkRegistry::target(const QString& providerId) const
{
    QFile file(linkFile(providerId));
    if (!file.open(QIODevice::ReadOnly))
        return {};

    const QString path = QString::fromUtf8(file.readAll()).trimmed();
    if (path.isEmpty() || !QFileInfo(path).isAbsolute())
        return {};
    if (!QFileInfo(path).isFile()) {
        BOOST_LOG_TRIVIAL(debug) << "Dev-link target missing for "
                                 << providerId.toStdString() << ": " << path.toStdString();
        return {};
    }
    return path;
}

QMap<QString, QString> DevLinkRegistry::links() const
{
    QMap<QString, QString> result;
    QDir dir(linksDir_);
    if (!dir.exists())
        return result;

    const auto entries = dir.entryList({QStringLiteral("*") + kLinkSuffix}, QDir::Files, QDir::Name);
    for (const auto& entry : entries) {
        const QString providerId = entry.left(entry.size() - kLinkSuffix.size());
        const QString path = target(providerId);
        if (!path.isEmpty())
            result.insert(providerId, path);
    }
    return result;
}

} // namespace sigil
