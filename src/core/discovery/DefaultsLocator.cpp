#include "DefaultsLocator.hpp"
#include "ProviderId.hpp"
#include "core/policy/Scope.hpp"
#include <QDir>
#include <QFileInfo>
#include <boost/log/trivial.hpp>

namespace sigil {

DefaultsLocator::DefaultsLocator(DevLinkRegistry devLinks, QStringList searchDirs)
    : devLinks_(std::move(devLinks)), searchDirs_(std::move(searchDirs))
{
}

QString DefaultsLocator::resolveDefaultsPath(const QString& providerId) const
{
    const QString pid = normalizeProviderId(providerId);

    const QString linked = devLinks_.target(pid);
    if (!linked.isEmpty()) {
        BOOST_LOG_TRIVIAL(debug) << "Defaults for " << pid.toStdString()
                                 << " via dev-link: " << linked.toStdString();
        return linked;
    }

    for (const auto& dir : searchDirs_) {
        const QString candidate = QDir(dir).filePath(pid + QStringLiteral("/.sigil/") + kSettingsFileName);
        if (QFileInfo(candidate).isFile()) {
            BOOST_LOG_TRIVIAL(debug) << "Defaults for " << pid.toStdString()
                                     << ": " << candidate.toStdString();
            return candidate;
        }
    }

    BOOST_LOG_TRIVIAL(debug) << "No defaults file for " << pid.toStdString();
    return {};
}

QStringList DefaultsLocator::knownProviders() const
{
    QStringList result = devLinks_.links().keys();

    for (const auto& base : searchDirs_) {
        QDir dir(base);
        if (!dir.exists())
            continue;
        for (const auto& entry : dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot)) {
            const QString settings = dir.filePath(entry + QStringLiteral("/.sigil/") + kSettingsFileName);
            if (!QFileInfo(settings).isFile())
                continue;
            if (!isValidProviderId(entry)) {
                BOOST_LOG_TRIVIAL(warning) << "Skipping defaults with invalid provider name: "
                                           << entry.toStdString();
                continue;
            }
            result.append(normalizeProviderId(entry));
        }
    }

    result.removeDuplicates();
    result.sort();
    return result;
}

} // namespace sigil
