#include "Scope.hpp"
#include "core/Paths.hpp"
#include "core/discovery/ProjectRoot.hpp"
#include <QDir>

namespace sigil {

ScopeContext ScopeContext::forProvider(const QString& providerId)
{
    ScopeContext ctx;
    ctx.providerId = providerId;
    ctx.hostId = Paths::hostId();
    ctx.userConfigDir = Paths::userConfigDir();
    ctx.projectDir = findProjectRoot();
    return ctx;
}

Scope::Scope(const QString& id, bool writable, bool machineAffinity, PathResolver resolver)
    : id_(id)
    , writable_(writable)
    , machineAffinity_(machineAffinity)
    , kind_(ScopeKind::FileBacked)
    , resolver_(std::move(resolver))
{
}

Scope::Scope(const QString& id, ScopeKind kind)
    : id_(id), kind_(kind)
{
}

Scope Scope::overlay(const QString& id)
{
    return Scope(id, ScopeKind::Overlay);
}

Scope Scope::defaults()
{
    return Scope(kDefaultScope, false, false, [](const ScopeContext& ctx) {
        return ctx.defaultsPath;
    });
}

Scope Scope::user(const QString& id, bool machineAffinity)
{
    return Scope(id, true, machineAffinity, [](const ScopeContext& ctx) -> QString {
        if (ctx.userConfigDir.isEmpty() || ctx.providerId.isEmpty())
            return {};
        return QDir(ctx.userConfigDir).filePath(ctx.providerId + QLatin1Char('/') + kSettingsFileName);
    });
}

Scope Scope::project(const QString& id, bool machineAffinity)
{
    return Scope(id, true, machineAffinity, [](const ScopeContext& ctx) -> QString {
        if (ctx.projectDir.isEmpty() || ctx.providerId.isEmpty())
            return {};
        return QDir(ctx.projectDir).filePath(QStringLiteral(".sigil/") + ctx.providerId
                                             + QLatin1Char('/') + kSettingsFileName);
    });
}

QString Scope::basePath(const ScopeContext& context) const
{
    if (kind_ == ScopeKind::Overlay || !resolver_)
        return {};
    return resolver_(context);
}

} // namespace sigil
