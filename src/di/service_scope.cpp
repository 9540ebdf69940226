#include "weave/di/service_scope.hpp"

#include <stdexcept>

#include "weave/log/logger.hpp"

namespace weave::di {

ServiceScope::ServiceScope(std::shared_ptr<const ServiceRegistry> registry,
                           std::shared_ptr<InstanceCache> singletons,
                           ContainerConfig config)
    : registry_(std::move(registry)),
      singletons_(std::move(singletons)),
      config_(std::move(config)) {
    if (!registry_ || !singletons_) {
        throw std::invalid_argument(
            "ServiceScope requires a registry and a singleton cache");
    }
    if (!config_.default_scope_name.empty()) {
        name_ = config_.default_scope_name;
    }
}

DependencyContext ServiceScope::create_context() {
    return DependencyContext(shared_from_this());
}

DependencyContext ServiceScope::create_context(ExoticContext exotic) {
    return DependencyContext(
        shared_from_this(),
        std::make_shared<const ExoticContext>(std::move(exotic)));
}

Instance ServiceScope::resolve(const std::string& name,
                               DependencyContext& context) {
    throw_if_circular_referenced(name);

    if (!registry_->has(name)) {
        fail(ResolveError::Kind::UNREGISTERED, "Invalid service name: " + name,
             name);
    }
    const ServiceDescriptor& descriptor = registry_->get(name);

    switch (descriptor.lifetime) {
        case ServiceLifetime::SINGLETON: {
            if (auto it = singletons_->find(name); it != singletons_->end()) {
                return it->second;
            }
            Instance instance = create(name, descriptor, context);
            singletons_->emplace(name, instance);
            return instance;
        }
        case ServiceLifetime::SCOPED: {
            if (auto it = scoped_.find(name); it != scoped_.end()) {
                if (config_.validate_cached_lifetimes) {
                    throw_if_lifetime_exceeded(name);
                }
                return it->second;
            }
            throw_if_lifetime_exceeded(name);
            Instance instance = create(name, descriptor, context);
            scoped_.emplace(name, instance);
            return instance;
        }
        case ServiceLifetime::TRANSIENT:
            throw_if_lifetime_exceeded(name);
            return create(name, descriptor, context);
    }
    return Instance();
}

Instance ServiceScope::create(const std::string& name,
                              const ServiceDescriptor& descriptor,
                              DependencyContext& context) {
    WEAVE_LOG_TRACE << label() << "Creating " << to_string(descriptor.lifetime)
                    << " service '" << name << "'";

    ResolutionGuard guard(path_, name);
    DependencyContext view = context.non_owning();
    return descriptor.create(view);
}

std::string ServiceScope::label() const {
    return name_ ? "/" + *name_ + "/ " : std::string("/(unnamed)/ ");
}

void ServiceScope::throw_if_circular_referenced(const std::string& name) const {
    if (auto index = path_.last_index_of(name)) {
        fail(ResolveError::Kind::CIRCULAR_REFERENCE,
             label() + "Invalid service resolution: " +
                 path_.describe(*index, name),
             name);
    }
}

void ServiceScope::throw_if_lifetime_exceeded(const std::string& name) const {
    const auto& entries = path_.entries();
    for (size_t index = entries.size(); index > 0; --index) {
        const auto& dependent = registry_->get(entries[index - 1]);
        if (dependent.lifetime == ServiceLifetime::SINGLETON) {
            fail(ResolveError::Kind::LIFETIME_EXCEEDED,
                 label() + "Invalid service lifetime: " +
                     path_.describe(index - 1, name),
                 name);
        }
    }
}

void ServiceScope::fail(ResolveError::Kind kind, const std::string& message,
                        const std::string& name) const {
    WEAVE_LOG_DEBUG << message;

    std::vector<std::string> path = path_.entries();
    path.push_back(name);
    throw ResolveError(kind, message, name_.value_or(std::string()),
                       std::move(path));
}

}  // namespace weave::di
