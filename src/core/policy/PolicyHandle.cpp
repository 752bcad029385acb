#include "PolicyHandle.hpp"
#include <boost/log/trivial.hpp>

namespace sigil {

PolicyHandle::PolicyHandle(ScopePolicy initial)
    : policy_(std::make_shared<const ScopePolicy>(std::move(initial)))
{
}

std::shared_ptr<const ScopePolicy> PolicyHandle::current() const
{
    QMutexLocker lock(&mutex_);
    return policy_;
}

void PolicyHandle::install(ScopePolicy policy)
{
    auto next = std::make_shared<const ScopePolicy>(std::move(policy));
    BOOST_LOG_TRIVIAL(info) << "PolicyHandle: installing policy "
                            << next->scopeIds().join(QStringLiteral(" > ")).toStdString();
    QMutexLocker lock(&mutex_);
    policy_ = std::move(next);
}

} // namespace sigil
