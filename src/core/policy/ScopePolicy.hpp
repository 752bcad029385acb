#pragma once

#include "Scope.hpp"
#include <QStringList>
#include <vector>

namespace sigil {

/// Which family wins when both user and project scopes hold a key.
enum class PrecedenceMode {
    ProjectOverUser,
    UserOverProject
};

/// "project_over_user" / "user_over_project" (case-insensitive, '-' accepted
/// for '_'). Returns false for anything else and leaves mode untouched.
bool parsePrecedenceMode(const QString& text, PrecedenceMode& mode);

/// Ordered set of scopes, highest precedence first.
///
/// Precedence is exactly the sequence order. A policy is a value: every
/// modifier returns a new policy, so a resolver holding one is never
/// affected by somebody else building or installing another.
///
/// Construction validates that the sequence is non-empty, ids are unique and
/// exactly one "default" scope exists, last, file-backed and read-only.
/// Violations throw InvalidPolicyError.
class ScopePolicy {
public:
    explicit ScopePolicy(std::vector<Scope> scopes);

    /// env, project-local, project, user-local, user, default
    static ScopePolicy projectOverUser();
    /// env, user-local, user, project-local, project, default
    static ScopePolicy userOverProject();

    const std::vector<Scope>& scopes() const { return scopes_; }
    QStringList scopeIds() const;
    QStringList machineScopes() const;

    bool contains(const QString& scopeId) const;

    /// Throws UnknownScopeError.
    const Scope& scope(const QString& scopeId) const;

    /// Throws UnknownScopeError.
    bool canWrite(const QString& scopeId) const;

    /// File path for scopeId under context. Machine-affinity scopes get
    /// "-local-<host>" inserted before the suffix (settings-local-box.ini).
    /// Empty for overlays and for scopes whose directory is unknown.
    QString resolvePath(const QString& scopeId, const ScopeContext& context) const;

    /// Copy without removedIds and with added inserted just above the
    /// defaults scope. An added scope whose id already exists replaces it
    /// in place.
    ScopePolicy withScopes(const std::vector<Scope>& added, const QStringList& removedIds = {}) const;

    /// Same scopes in a new order. ids must name every scope exactly once.
    ScopePolicy reordered(const QStringList& ids) const;

    /// The user and project scopes (with their -local variants) regrouped so
    /// the family named by mode comes first, each family keeping its internal
    /// order and every other scope keeping its position. Unchanged when the
    /// policy lacks either family.
    ScopePolicy withPrecedence(PrecedenceMode mode) const;

private:
    void validate() const;

    std::vector<Scope> scopes_;
};

} // namespace sigil
