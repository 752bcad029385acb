#pragma once

#include "ScopePolicy.hpp"
#include <QMutex>
#include <memory>

namespace sigil {

/// Replaceable "current policy" for an application.
///
/// Created explicitly by the host and handed to whatever builds resolvers.
/// install() swaps the pointer; resolvers that already took a snapshot via
/// current() keep resolving against the policy they started with.
class PolicyHandle {
public:
    explicit PolicyHandle(ScopePolicy initial = ScopePolicy::projectOverUser());

    std::shared_ptr<const ScopePolicy> current() const;
    void install(ScopePolicy policy);

private:
    mutable QMutex mutex_;
    std::shared_ptr<const ScopePolicy> policy_;
};

} // namespace sigil
