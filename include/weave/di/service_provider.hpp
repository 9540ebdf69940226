#pragma once

#include <memory>

#include "weave/di/container_config.hpp"
#include "weave/di/dependency_context.hpp"
#include "weave/di/service_registry.hpp"
#include "weave/di/service_scope.hpp"

namespace weave::di {

/**
 * @brief Root object holding the registry and the singleton cache
 *
 * Singletons constructed in any scope begun from this provider are reused
 * by every other such scope. Separate providers never share instances.
 */
class ServiceProvider {
public:
    explicit ServiceProvider(std::shared_ptr<const ServiceRegistry> registry,
                             ContainerConfig config = {});

    // Held through std::unique_ptr; neither copyable nor movable
    ServiceProvider(const ServiceProvider&) = delete;
    ServiceProvider& operator=(const ServiceProvider&) = delete;

    const ServiceRegistry& registry() const { return *registry_; }
    const ContainerConfig& config() const { return config_; }

    std::shared_ptr<ServiceScope> begin_scope();

    // Shorthand for begin_scope()->create_context()
    DependencyContext begin();

    size_t singleton_count() const { return singletons_->size(); }

private:
    std::shared_ptr<const ServiceRegistry> registry_;
    std::shared_ptr<InstanceCache> singletons_;
    ContainerConfig config_;
};

}  // namespace weave::di
