#include "weave/di/service_provider.hpp"

#include <stdexcept>

#include "weave/di/di.hpp"
#include "weave/log/logger.hpp"

namespace weave::di {

ServiceProvider::ServiceProvider(
    std::shared_ptr<const ServiceRegistry> registry, ContainerConfig config)
    : registry_(std::move(registry)),
      singletons_(std::make_shared<InstanceCache>()),
      config_(std::move(config)) {
    if (!registry_) {
        throw std::invalid_argument("ServiceProvider requires a registry");
    }
    WEAVE_LOG_DEBUG << "Service provider created with " << registry_->size()
                    << " registered services";
}

std::shared_ptr<ServiceScope> ServiceProvider::begin_scope() {
    auto scope =
        std::make_shared<ServiceScope>(registry_, singletons_, config_);
    WEAVE_LOG_DEBUG << "Began scope "
                    << scope->name().value_or("(unnamed)");
    return scope;
}

DependencyContext ServiceProvider::begin() {
    return begin_scope()->create_context();
}

std::unique_ptr<ServiceProvider> create_provider(
    const ServiceRegistry::BuildFunction& build, ContainerConfig config) {
    return create_provider(std::make_shared<const ServiceRegistry>(build),
                           std::move(config));
}

std::unique_ptr<ServiceProvider> create_provider(
    std::shared_ptr<const ServiceRegistry> registry, ContainerConfig config) {
    return std::make_unique<ServiceProvider>(std::move(registry),
                                             std::move(config));
}

}  // namespace weave::di
