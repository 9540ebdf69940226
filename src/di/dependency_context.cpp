#include "weave/di/dependency_context.hpp"

#include <stdexcept>

#include "weave/di/exotic_context.hpp"
#include "weave/di/service_scope.hpp"
#include "weave/log/logger.hpp"

namespace weave::di {

DependencyContext::DependencyContext(
    std::shared_ptr<ServiceScope> scope,
    std::shared_ptr<const ExoticContext> exotic)
    : owner_(std::move(scope)), scope_(owner_), exotic_(std::move(exotic)) {
    if (!owner_) {
        throw std::invalid_argument("DependencyContext requires a scope");
    }
}

DependencyContext::DependencyContext(
    std::weak_ptr<ServiceScope> scope,
    std::shared_ptr<const ExoticContext> exotic)
    : scope_(std::move(scope)), exotic_(std::move(exotic)) {}

DependencyContext DependencyContext::non_owning() const {
    return DependencyContext(scope_, exotic_);
}

std::shared_ptr<ServiceScope> DependencyContext::lock_scope() const {
    if (owner_) {
        return owner_;
    }
    if (auto scope = scope_.lock()) {
        return scope;
    }
    WEAVE_LOG_DEBUG << "Lookup through a context whose scope has expired";
    throw ResolveError(ResolveError::Kind::SCOPE_EXPIRED,
                       "Service scope has expired");
}

Instance DependencyContext::resolve(const std::string& name) {
    if (name.empty()) {
        WEAVE_LOG_DEBUG << "Rejected empty service name";
        throw ResolveError(ResolveError::Kind::INVALID_NAME,
                           "Invalid service name: (empty)");
    }
    if (name == THENABLE_PROBE) {
        return Instance();
    }
    if (exotic_ && exotic_->contains(name)) {
        return exotic_->get(name);
    }
    // Held for the whole resolution so a non-owning view stays valid
    auto scope = lock_scope();
    return scope->resolve(name, *this);
}

bool DependencyContext::has(const std::string& name) const {
    if (name.empty() || name == THENABLE_PROBE) {
        return false;
    }
    return (exotic_ && exotic_->contains(name)) ||
           lock_scope()->registry().has(name);
}

InstanceMap DependencyContext::resolve_all() {
    InstanceMap instances;
    if (exotic_) {
        for (const auto& name : exotic_->names()) {
            instances.emplace(name, resolve(name));
        }
    }
    auto scope = lock_scope();
    for (const auto& name : scope->registry().names()) {
        if (instances.find(name) == instances.end()) {
            instances.emplace(name, resolve(name));
        }
    }
    return instances;
}

}  // namespace weave::di
