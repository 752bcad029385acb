#include "ScopePolicy.hpp"
#include "core/Errors.hpp"
#include <QFileInfo>
#include <QSet>
#include <algorithm>

namespace sigil {

bool parsePrecedenceMode(const QString& text, PrecedenceMode& mode)
{
    const QString normalized = text.trimmed().toLower().replace(QLatin1Char('-'), QLatin1Char('_'));
    if (normalized == QLatin1String("project_over_user")) {
        mode = PrecedenceMode::ProjectOverUser;
        return true;
    }
    if (normalized == QLatin1String("user_over_project")) {
        mode = PrecedenceMode::UserOverProject;
        return true;
    }
    return false;
}

ScopePolicy::ScopePolicy(std::vector<Scope> scopes)
    : scopes_(std::move(scopes))
{
    validate();
}

void ScopePolicy::validate() const
{
    if (scopes_.empty())
        throw InvalidPolicyError(QStringLiteral("A scope policy needs at least one scope"));

    QSet<QString> seen;
    int defaults = 0;
    for (const auto& s : scopes_) {
        if (s.id().isEmpty())
            throw InvalidPolicyError(QStringLiteral("Scope ids must not be empty"));
        if (seen.contains(s.id()))
            throw InvalidPolicyError(QStringLiteral("Duplicate scope id '%1'").arg(s.id()));
        seen.insert(s.id());
        if (s.isDefaults())
            ++defaults;
    }

    if (defaults != 1)
        throw InvalidPolicyError(QStringLiteral("Policy must contain exactly one '%1' scope").arg(kDefaultScope));

    const Scope& last = scopes_.back();
    if (!last.isDefaults())
        throw InvalidPolicyError(QStringLiteral("'%1' must be the lowest-precedence scope").arg(kDefaultScope));
    if (last.isWritable() || last.isOverlay())
        throw InvalidPolicyError(QStringLiteral("'%1' must be a read-only file scope").arg(kDefaultScope));
}

ScopePolicy ScopePolicy::projectOverUser()
{
    return ScopePolicy({
        Scope::overlay(kEnvScope),
        Scope::project(kProjectLocalScope, true),
        Scope::project(kProjectScope),
        Scope::user(kUserLocalScope, true),
        Scope::user(kUserScope),
        Scope::defaults(),
    });
}

ScopePolicy ScopePolicy::userOverProject()
{
    return ScopePolicy({
        Scope::overlay(kEnvScope),
        Scope::user(kUserLocalScope, true),
        Scope::user(kUserScope),
        Scope::project(kProjectLocalScope, true),
        Scope::project(kProjectScope),
        Scope::defaults(),
    });
}

QStringList ScopePolicy::scopeIds() const
{
    QStringList ids;
    for (const auto& s : scopes_)
        ids.append(s.id());
    return ids;
}

QStringList ScopePolicy::machineScopes() const
{
    QStringList ids;
    for (const auto& s : scopes_) {
        if (s.hasMachineAffinity())
            ids.append(s.id());
    }
    return ids;
}

bool ScopePolicy::contains(const QString& scopeId) const
{
    return std::any_of(scopes_.begin(), scopes_.end(),
                       [&](const Scope& s) { return s.id() == scopeId; });
}

const Scope& ScopePolicy::scope(const QString& scopeId) const
{
    for (const auto& s : scopes_) {
        if (s.id() == scopeId)
            return s;
    }
    throw UnknownScopeError(scopeId);
}

bool ScopePolicy::canWrite(const QString& scopeId) const
{
    return scope(scopeId).isWritable();
}

QString ScopePolicy::resolvePath(const QString& scopeId, const ScopeContext& context) const
{
    const Scope& s = scope(scopeId);
    const QString base = s.basePath(context);
    if (base.isEmpty() || !s.hasMachineAffinity())
        return base;

    QFileInfo info(base);
    const QString host = context.hostId.isEmpty() ? QStringLiteral("localhost") : context.hostId;
    QString name = info.completeBaseName() + QStringLiteral("-local-") + host;
    if (!info.suffix().isEmpty())
        name += QLatin1Char('.') + info.suffix();
    return info.dir().filePath(name);
}

ScopePolicy ScopePolicy::withScopes(const std::vector<Scope>& added, const QStringList& removedIds) const
{
    std::vector<Scope> result;
    for (const auto& s : scopes_) {
        if (!removedIds.contains(s.id()))
            result.push_back(s);
    }

    for (const auto& scope : added) {
        auto existing = std::find_if(result.begin(), result.end(),
                                     [&](const Scope& s) { return s.id() == scope.id(); });
        if (existing != result.end()) {
            *existing = scope;
            continue;
        }
        auto defaultsPos = std::find_if(result.begin(), result.end(),
                                        [](const Scope& s) { return s.isDefaults(); });
        result.insert(defaultsPos, scope);
    }

    return ScopePolicy(std::move(result));
}

ScopePolicy ScopePolicy::reordered(const QStringList& ids) const
{
    if (ids.size() != static_cast<int>(scopes_.size()))
        throw InvalidPolicyError(QStringLiteral("Reordering must name every scope exactly once"));

    std::vector<Scope> result;
    result.reserve(scopes_.size());
    for (const auto& id : ids) {
        if (ids.count(id) != 1)
            throw InvalidPolicyError(QStringLiteral("Scope '%1' named more than once").arg(id));
        result.push_back(scope(id));
    }
    return ScopePolicy(std::move(result));
}

ScopePolicy ScopePolicy::withPrecedence(PrecedenceMode mode) const
{
    std::vector<size_t> positions;
    std::vector<Scope> user;
    std::vector<Scope> project;
    for (size_t i = 0; i < scopes_.size(); ++i) {
        const QString& id = scopes_[i].id();
        if (id == kUserScope || id == kUserLocalScope) {
            positions.push_back(i);
            user.push_back(scopes_[i]);
        } else if (id == kProjectScope || id == kProjectLocalScope) {
            positions.push_back(i);
            project.push_back(scopes_[i]);
        }
    }
    if (user.empty() || project.empty())
        return *this;

    std::vector<Scope> winners = mode == PrecedenceMode::UserOverProject ? user : project;
    const std::vector<Scope>& losers = mode == PrecedenceMode::UserOverProject ? project : user;
    winners.insert(winners.end(), losers.begin(), losers.end());

    std::vector<Scope> result = scopes_;
    for (size_t k = 0; k < positions.size(); ++k)
        result[positions[k]] = winners[k];
    return ScopePolicy(std::move(result));
}

} // namespace sigil
