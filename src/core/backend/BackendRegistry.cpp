#include "BackendRegistry.hpp"
#include "IniBackend.hpp"
#include "JsonBackend.hpp"
#include "YamlBackend.hpp"
#include "core/Errors.hpp"
#include <QFileInfo>
#include <boost/log/trivial.hpp>

namespace sigil {

std::shared_ptr<BackendRegistry> BackendRegistry::withBuiltins()
{
    auto registry = std::make_shared<BackendRegistry>();
    registry->registerBackend(std::make_shared<IniBackend>());
    registry->registerBackend(std::make_shared<YamlBackend>());
    registry->registerBackend(std::make_shared<JsonBackend>());
    return registry;
}

QString BackendRegistry::normalizeSuffix(const QString& suffix)
{
    QString s = suffix.trimmed().toLower();
    if (s.startsWith(QLatin1Char('.')))
        s.remove(0, 1);
    return s;
}

void BackendRegistry::registerBackend(const QString& suffix, std::shared_ptr<const IBackend> backend)
{
    const QString key = normalizeSuffix(suffix);
    if (key.isEmpty() || !backend)
        return;

    QWriteLocker lock(&lock_);
    BOOST_LOG_TRIVIAL(debug) << "BackendRegistry: ." << key.toStdString()
                             << " -> " << backend->name().toStdString();
    backends_[key] = std::move(backend);
}

void BackendRegistry::registerBackend(std::shared_ptr<const IBackend> backend)
{
    if (!backend)
        return;
    for (const auto& suffix : backend->suffixes())
        registerBackend(suffix, backend);
}

bool BackendRegistry::supports(const QString& path) const
{
    QReadLocker lock(&lock_);
    return backends_.contains(normalizeSuffix(QFileInfo(path).suffix()));
}

std::shared_ptr<const IBackend> BackendRegistry::backendForPath(const QString& path) const
{
    const QString suffix = normalizeSuffix(QFileInfo(path).suffix());
    QReadLocker lock(&lock_);
    auto it = backends_.constFind(suffix);
    if (it == backends_.constEnd())
        throw UnsupportedFormatError(QStringLiteral("No backend registered for '.%1' (%2)").arg(suffix, path));
    return it.value();
}

QStringList BackendRegistry::registeredSuffixes() const
{
    QReadLocker lock(&lock_);
    return backends_.keys();
}

} // namespace sigil
