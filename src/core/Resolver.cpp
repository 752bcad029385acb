#include "Resolver.hpp"
#include "core/Errors.hpp"
#include "core/discovery/IDefaultsLocator.hpp"
#include "core/discovery/ProviderId.hpp"
#include "core/policy/PolicyHandle.hpp"
#include "core/secrets/SecretChain.hpp"
#include "core/secrets/VaultProvider.hpp"
#include <QFileInfo>
#include <QSet>
#include <boost/log/trivial.hpp>
#include <utility>
#include <vector>

namespace sigil {

static const QString kSecretPrefix = QStringLiteral("secret.");

namespace {

struct WriteTarget {
    const Resolver* resolver;
    QString scopeId;
};

thread_local std::vector<WriteTarget> tlsWriteTargets;

} // namespace

Resolver::Resolver(const QString& providerId,
                   std::shared_ptr<const ScopePolicy> policy,
                   ScopeContext context,
                   std::shared_ptr<const BackendRegistry> backends,
                   EnvReader envReader)
    : providerId_(providerId)
    , policy_(std::move(policy))
    , context_(std::move(context))
    , backends_(std::move(backends))
{
    if (!policy_)
        throw InvalidPolicyError(QStringLiteral("Resolver needs a scope policy"));
    projectWins_ = std::make_shared<const ScopePolicy>(policy_->withPrecedence(PrecedenceMode::ProjectOverUser));
    userWins_ = std::make_shared<const ScopePolicy>(policy_->withPrecedence(PrecedenceMode::UserOverProject));
    if (!backends_)
        backends_ = BackendRegistry::withBuiltins();
    if (context_.providerId.isEmpty())
        context_.providerId = providerId_;

    if (!envReader)
        envReader = [](const QString& pid) { return readEnv(pid); };
    overlays_.insert(kEnvScope, std::move(envReader));

    if (policy_->contains(kUserScope) && policy_->canWrite(kUserScope)) {
        defaultWriteScope_ = kUserScope;
    } else {
        for (const auto& s : policy_->scopes()) {
            if (s.isWritable()) {
                defaultWriteScope_ = s.id();
                break;
            }
        }
    }
}

std::unique_ptr<Resolver> Resolver::forProvider(const QString& providerId,
                                                const PolicyHandle& handle,
                                                const IDefaultsLocator* locator)
{
    const QString pid = normalizeProviderId(providerId);
    if (!isValidProviderId(pid))
        throw InvalidKeyError(providerId);

    ScopeContext ctx = ScopeContext::forProvider(pid);
    if (locator)
        ctx.defaultsPath = locator->resolveDefaultsPath(pid);

    BOOST_LOG_TRIVIAL(debug) << "Resolver: " << pid.toStdString()
                             << " project=" << ctx.projectDir.toStdString()
                             << " defaults=" << ctx.defaultsPath.toStdString();
    auto resolver = std::make_unique<Resolver>(pid, handle.current(), ctx);

    const QString metaPath = KeyMetadata::pathBeside(ctx.defaultsPath);
    if (!metaPath.isEmpty() && QFileInfo::exists(metaPath))
        resolver->setKeyMetadata(std::make_shared<const KeyMetadata>(KeyMetadata::fromFile(metaPath)));

    auto chain = SecretChain::standard(pid, VaultProvider::defaultPath(pid));
    if (auto vault = chain->vault()) {
        try {
            vault->unlockFromEnvironment();
        } catch (const SigilError& e) {
            BOOST_LOG_TRIVIAL(warning) << "Resolver: vault for " << pid.toStdString()
                                       << " stays locked: " << e.what();
        }
    }
    resolver->setSecretChain(std::move(chain));
    return resolver;
}

void Resolver::setSecretChain(std::shared_ptr<SecretChain> chain)
{
    secrets_ = std::move(chain);
}

void Resolver::setKeyMetadata(std::shared_ptr<const KeyMetadata> metadata)
{
    metadata_ = std::move(metadata);
}

void Resolver::setOverlayReader(const QString& scopeId, EnvReader reader)
{
    QMutexLocker lock(&mutex_);
    overlays_.insert(scopeId, std::move(reader));
}

QString Resolver::pathFor(const QString& scopeId) const
{
    return policy_->resolvePath(scopeId, context_);
}

KeyMeta Resolver::metaFor(const QString& key) const
{
    return metadata_ ? metadata_->lookup(key) : KeyMeta();
}

bool Resolver::isSecret(const QString& key) const
{
    return key.startsWith(kSecretPrefix) || metaFor(key).secret;
}

QString Resolver::secretName(const QString& key)
{
    return key.startsWith(kSecretPrefix) ? key.mid(kSecretPrefix.size()) : key;
}

// Missing file (or directory) is an empty scope. Anything else propagates.
Mapping Resolver::readFile(const QString& scopeId, const QString& path) const
{
    if (path.isEmpty())
        return {};
    auto backend = backends_->backendForPath(path);
    try {
        return backend->load(path);
    } catch (const NotFoundError&) {
        BOOST_LOG_TRIVIAL(debug) << "Resolver: scope " << scopeId.toStdString()
                                 << " has no file at " << path.toStdString();
        return {};
    }
}

// Caller holds mutex_.
Mapping Resolver::loadScope(const Scope& scope) const
{
    if (scope.isOverlay()) {
        auto it = overlays_.constFind(scope.id());
        if (it == overlays_.constEnd() || !it.value())
            return {};
        return it.value()(providerId_);
    }

    auto cached = cache_.constFind(scope.id());
    if (cached != cache_.constEnd())
        return cached.value();

    Mapping loaded = readFile(scope.id(), pathFor(scope.id()));
    cache_.insert(scope.id(), loaded);
    BOOST_LOG_TRIVIAL(debug) << "Resolver: loaded scope " << scope.id().toStdString()
                             << " (" << loaded.size() << " keys)";
    return loaded;
}

// Caller holds mutex_.
Resolver::Snapshot Resolver::snapshot() const
{
    Snapshot scopes;
    for (const auto& s : policy_->scopes())
        scopes.insert(s.id(), loadScope(s));
    return scopes;
}

// The key's own policy wins over a stored kPolicySettingKey, which wins over
// the installed order. The setting is read with the installed order.
const ScopePolicy& Resolver::orderFor(const QString& key, const Snapshot& scopes) const
{
    const KeyMeta meta = metaFor(key);
    PrecedenceMode mode = meta.precedence;
    bool found = meta.hasPrecedence;

    for (size_t i = 0; !found && i < policy_->scopes().size(); ++i) {
        const Mapping m = scopes.value(policy_->scopes().at(i).id());
        auto it = m.constFind(kPolicySettingKey);
        if (it == m.constEnd())
            continue;
        if (parsePrecedenceMode(it.value(), mode)) {
            found = true;
        } else {
            BOOST_LOG_TRIVIAL(warning) << "Resolver: ignoring " << kPolicySettingKey.toStdString()
                                       << " = " << it.value().toStdString();
        }
    }

    if (!found)
        return *policy_;
    return mode == PrecedenceMode::UserOverProject ? *userWins_ : *projectWins_;
}

bool Resolver::lookup(const QString& key, QString& raw, QString& scopeId) const
{
    QMutexLocker lock(&mutex_);
    const Snapshot scopes = snapshot();
    for (const auto& s : orderFor(key, scopes).scopes()) {
        const Mapping m = scopes.value(s.id());
        auto it = m.constFind(key);
        if (it != m.constEnd()) {
            raw = it.value();
            scopeId = s.id();
            return true;
        }
    }
    return false;
}

QStringList Resolver::precedenceFor(const QString& key) const
{
    QMutexLocker lock(&mutex_);
    const Snapshot scopes = snapshot();
    QStringList ids;
    for (const auto& s : orderFor(key, scopes).scopes())
        ids.append(s.id());
    return ids;
}

bool Resolver::lookupSecret(const QString& key, QString& raw) const
{
    if (!secrets_ || !isSecret(key))
        return false;
    const SecretLookup found = secrets_->get(secretName(key));
    if (!found.isHit())
        return false;
    raw = found.value;
    return true;
}

QString Resolver::rawValue(const QString& key) const
{
    QString raw;
    if (lookupSecret(key, raw))
        return raw;
    QString scopeId;
    if (lookup(key, raw, scopeId))
        return raw;
    return QString();
}

QVariant Resolver::value(const QString& key, const QVariant& defaultValue, const CastFn& cast) const
{
    QString raw;
    QString scopeId;
    if (!lookupSecret(key, raw) && !lookup(key, raw, scopeId))
        return defaultValue;
    if (cast)
        return applyCast(key, raw, cast);
    return autoCast(raw).value;
}

int Resolver::intValue(const QString& key, int defaultValue) const
{
    return value(key, defaultValue, casts::toInt).toInt();
}

double Resolver::doubleValue(const QString& key, double defaultValue) const
{
    return value(key, defaultValue, casts::toDouble).toDouble();
}

bool Resolver::boolValue(const QString& key, bool defaultValue) const
{
    return value(key, defaultValue, casts::toBool).toBool();
}

bool Resolver::set(const QString& key, const QVariant& value, const QString& scopeId)
{
    if (!isValidKey(key))
        throw InvalidKeyError(key);

    if (isSecret(key)) {
        if (!secrets_)
            throw NotWritableError(QStringLiteral("No secret store configured for '%1'").arg(key));
        if (!value.isValid())
            return secrets_->remove(secretName(key));
        secrets_->set(secretName(key), stringifyValue(value));
        return true;
    }

    const QString target = scopeId.isEmpty() ? writeTarget() : scopeId;
    if (target.isEmpty())
        throw NotWritableError(QStringLiteral("Policy has no writable scope"));
    if (!policy_->canWrite(target))
        throw NotWritableError(QStringLiteral("Scope '%1' is read-only").arg(target));

    const KeyMeta meta = metaFor(key);
    const bool userOverride = meta.hasPrecedence && meta.precedence == PrecedenceMode::UserOverProject;
    if (meta.locked && !userOverride && (target == kUserScope || target == kUserLocalScope))
        throw LockedKeyError(key);

    const QString path = pathFor(target);
    if (path.isEmpty())
        throw NotWritableError(QStringLiteral("Scope '%1' has no location for %2").arg(target, providerId_));
    auto backend = backends_->backendForPath(path);

    QMutexLocker lock(&mutex_);
    // Always start from what is on disk, not the cache: another process may
    // have written since we last read.
    Mapping current = readFile(target, path);

    if (value.isValid()) {
        const QString text = stringifyValue(value);
        auto it = current.constFind(key);
        if (it != current.constEnd() && it.value() == text) {
            cache_.insert(target, current);
            return false;
        }
        current.insert(key, text);
    } else {
        if (!current.contains(key)) {
            cache_.insert(target, current);
            return false;
        }
        current.remove(key);
    }

    backend->save(path, current);
    cache_.remove(target);
    BOOST_LOG_TRIVIAL(info) << "Resolver: " << (value.isValid() ? "set " : "cleared ")
                            << key.toStdString() << " in " << target.toStdString();
    return true;
}

bool Resolver::clear(const QString& key, const QString& scopeId)
{
    return set(key, QVariant(), scopeId);
}

void Resolver::invalidateCache()
{
    QMutexLocker lock(&mutex_);
    cache_.clear();
}

void Resolver::invalidateCache(const QString& scopeId)
{
    QMutexLocker lock(&mutex_);
    cache_.remove(scopeId);
}

QString Resolver::effectiveScope(const QString& key) const
{
    QString raw;
    QString scopeId;
    if (lookup(key, raw, scopeId))
        return scopeId;
    return QString();
}

QStringList Resolver::listKeys() const
{
    return mergedValues().keys();
}

QList<QPair<QString, Mapping>> Resolver::scopedValues() const
{
    QMutexLocker lock(&mutex_);
    QList<QPair<QString, Mapping>> out;
    for (const auto& s : policy_->scopes())
        out.append(qMakePair(s.id(), loadScope(s)));
    return out;
}

Mapping Resolver::mergedValues() const
{
    QMutexLocker lock(&mutex_);
    const Snapshot scopes = snapshot();
    QSet<QString> keys;
    for (const auto& m : scopes) {
        for (auto kv = m.constBegin(); kv != m.constEnd(); ++kv)
            keys.insert(kv.key());
    }

    Mapping merged;
    for (const auto& key : keys) {
        for (const auto& s : orderFor(key, scopes).scopes()) {
            const Mapping& m = scopes[s.id()];
            auto it = m.constFind(key);
            if (it != m.constEnd()) {
                merged.insert(key, it.value());
                break;
            }
        }
    }
    return merged;
}

QMap<QString, QString> Resolver::exportEnv(const QString& prefix, bool includeSecrets) const
{
    const Mapping merged = mergedValues();
    QMap<QString, QString> out;
    for (auto it = merged.constBegin(); it != merged.constEnd(); ++it) {
        QString text = it.value();
        if (isSecret(it.key())) {
            if (!includeSecrets)
                continue;
            lookupSecret(it.key(), text);
        }
        out.insert(envVariableName(prefix, providerId_, it.key()), text);
    }
    return out;
}

void Resolver::setDefaultWriteScope(const QString& scopeId)
{
    if (!policy_->canWrite(scopeId))
        throw NotWritableError(QStringLiteral("Scope '%1' is read-only").arg(scopeId));
    defaultWriteScope_ = scopeId;
}

QString Resolver::writeTarget() const
{
    for (auto it = tlsWriteTargets.crbegin(); it != tlsWriteTargets.crend(); ++it) {
        if (it->resolver == this)
            return it->scopeId;
    }
    return defaultWriteScope_;
}

ScopedWriteTarget::ScopedWriteTarget(const Resolver& resolver, const QString& scopeId)
    : resolver_(&resolver)
{
    if (!resolver.policy().canWrite(scopeId))
        throw NotWritableError(QStringLiteral("Scope '%1' is read-only").arg(scopeId));
    tlsWriteTargets.push_back({resolver_, scopeId});
}

ScopedWriteTarget::~ScopedWriteTarget()
{
    for (auto it = tlsWriteTargets.end(); it != tlsWriteTargets.begin();) {
        --it;
        if (it->resolver == resolver_) {
            tlsWriteTargets.erase(it);
            break;
        }
    }
}

} // namespace sigil
