#pragma once

#include "core/EnvOverlay.hpp"
#include "core/Mapping.hpp"
#include "core/ValueCaster.hpp"
#include "core/backend/BackendRegistry.hpp"
#include "core/policy/KeyMetadata.hpp"
#include "core/policy/ScopePolicy.hpp"
#include <QList>
#include <QMutex>
#include <QPair>
#include <QVariant>
#include <memory>

namespace sigil {

class IDefaultsLocator;
class PolicyHandle;
class SecretChain;

/// Stored setting that flips user/project precedence for every key without
/// a policy of its own in the key metadata.
inline const QString kPolicySettingKey = QStringLiteral("sigil.policy");

/// Computes effective settings for one provider from the scopes of a policy.
///
/// Reads scan the policy's scopes in order and return the first scope that
/// holds the key (presence decides, not value). File scopes are loaded
/// through the backend registry and cached per scope; overlays are
/// synthesized on every read. Writes load the target file fresh, modify,
/// save atomically and drop that scope's cache entry.
///
/// The "env" overlay comes from envReader, readEnv() when none is given.
/// Keys starting with "secret." are looked up in the secret chain first
/// (with the prefix stripped) and written only to it; so are keys the key
/// metadata flags as secret.
///
/// The scope order for a key is the policy as installed, regrouped by
/// withPrecedence() when the key's metadata names a policy or, failing
/// that, when some scope stores kPolicySettingKey.
///
/// Thread-safe: one mutex guards the scope cache. setSecretChain() and
/// setKeyMetadata() are setup calls, made before the resolver is shared.
class Resolver {
public:
    Resolver(const QString& providerId,
             std::shared_ptr<const ScopePolicy> policy,
             ScopeContext context,
             std::shared_ptr<const BackendRegistry> backends = BackendRegistry::withBuiltins(),
             EnvReader envReader = EnvReader());

    /// Resolver for providerId (normalized) against the policy currently
    /// installed in handle, with the standard context. locator, when given,
    /// supplies the defaults file; settings.meta.yaml beside it becomes the
    /// key metadata. The standard secret chain is attached with its vault at
    /// VaultProvider::defaultPath() and unlocked from SIGIL_MASTER_PWD when
    /// that is set. A vault that does not open stays Locked.
    static std::unique_ptr<Resolver> forProvider(const QString& providerId,
                                                 const PolicyHandle& handle,
                                                 const IDefaultsLocator* locator = nullptr);

    Resolver(const Resolver&) = delete;
    Resolver& operator=(const Resolver&) = delete;

    const QString& providerId() const { return providerId_; }
    const ScopePolicy& policy() const { return *policy_; }
    const ScopeContext& context() const { return context_; }

    void setSecretChain(std::shared_ptr<SecretChain> chain);
    std::shared_ptr<SecretChain> secretChain() const { return secrets_; }

    void setKeyMetadata(std::shared_ptr<const KeyMetadata> metadata);
    std::shared_ptr<const KeyMetadata> keyMetadata() const { return metadata_; }

    /// Scope ids in the order value() consults them for key.
    QStringList precedenceFor(const QString& key) const;

    /// Mapping producer for an overlay scope other than "env". Unregistered
    /// overlays read as empty.
    void setOverlayReader(const QString& scopeId, EnvReader reader);

    /// File path scopeId resolves to, empty for overlays and unlocated scopes.
    QString pathFor(const QString& scopeId) const;

    /// Effective value. Without cast the raw text goes through autoCast();
    /// with cast, a rejected value throws CastError. Missing keys yield
    /// defaultValue. A corrupt or unsupported scope file throws.
    QVariant value(const QString& key, const QVariant& defaultValue = QVariant(),
                   const CastFn& cast = CastFn()) const;

    /// Effective raw text, or a null QString when absent.
    QString rawValue(const QString& key) const;

    int intValue(const QString& key, int defaultValue = 0) const;
    double doubleValue(const QString& key, double defaultValue = 0.0) const;
    bool boolValue(const QString& key, bool defaultValue = false) const;

    /// Store value in scopeId (the current write target when empty). An
    /// invalid QVariant removes the key. Returns false when the file already
    /// held exactly this state and nothing was written.
    /// Secret keys ignore scopeId and go to the secret chain's write target.
    /// Throws InvalidKeyError, UnknownScopeError, NotWritableError, and
    /// LockedKeyError for a locked key in a user scope (all before any disk
    /// access), then UnsupportedFormatError, CorruptFileError, IoFailureError.
    bool set(const QString& key, const QVariant& value, const QString& scopeId = QString());

    bool clear(const QString& key, const QString& scopeId = QString());

    /// Drop every cached scope mapping; the next read reloads from disk.
    void invalidateCache();
    void invalidateCache(const QString& scopeId);

    /// Id of the scope the effective value comes from, empty when absent.
    QString effectiveScope(const QString& key) const;

    /// Every key present in any scope, sorted.
    QStringList listKeys() const;

    /// (scope id, mapping) per scope in precedence order.
    QList<QPair<QString, Mapping>> scopedValues() const;

    /// Keys with their effective raw values.
    Mapping mergedValues() const;

    /// Effective values as environment variables, <prefix><PROVIDER>_<KEY>.
    /// Secret keys are left out unless includeSecrets.
    QMap<QString, QString> exportEnv(const QString& prefix = QStringLiteral("SIGIL_"),
                                     bool includeSecrets = false) const;

    /// Scope set() writes to without an explicit scope: "user" when the
    /// policy has it, else the first writable scope.
    QString defaultWriteScope() const { return defaultWriteScope_; }

    /// Throws UnknownScopeError or NotWritableError.
    void setDefaultWriteScope(const QString& scopeId);

    /// Innermost ScopedWriteTarget for this resolver on the calling thread,
    /// else defaultWriteScope().
    QString writeTarget() const;

private:
    using Snapshot = QMap<QString, Mapping>;

    KeyMeta metaFor(const QString& key) const;
    bool isSecret(const QString& key) const;
    static QString secretName(const QString& key);

    Mapping loadScope(const Scope& scope) const;
    Snapshot snapshot() const;
    const ScopePolicy& orderFor(const QString& key, const Snapshot& scopes) const;
    Mapping readFile(const QString& scopeId, const QString& path) const;
    bool lookup(const QString& key, QString& raw, QString& scopeId) const;
    bool lookupSecret(const QString& key, QString& raw) const;

    QString providerId_;
    std::shared_ptr<const ScopePolicy> policy_;
    std::shared_ptr<const ScopePolicy> projectWins_;
    std::shared_ptr<const ScopePolicy> userWins_;
    std::shared_ptr<const KeyMetadata> metadata_;
    ScopeContext context_;
    std::shared_ptr<const BackendRegistry> backends_;
    QMap<QString, EnvReader> overlays_;
    std::shared_ptr<SecretChain> secrets_;
    QString defaultWriteScope_;

    mutable QMutex mutex_;
    mutable QMap<QString, Mapping> cache_;
};

/// Redirects set()/clear() without an explicit scope to scopeId while
/// alive, for the calling thread only. Guards nest; destruction (normal or
/// by exception) restores the previous target.
class ScopedWriteTarget {
public:
    /// Throws UnknownScopeError or NotWritableError.
    ScopedWriteTarget(const Resolver& resolver, const QString& scopeId);
    ~ScopedWriteTarget();

    ScopedWriteTarget(const ScopedWriteTarget&) = delete;
    ScopedWriteTarget& operator=(const ScopedWriteTarget&) = delete;

private:
    const Resolver* resolver_;
};

} // namespace sigil
