#pragma once

/**
 * @file di.hpp
 * @brief Weave dependency injection
 *
 * Services are registered by name with a lifetime, then resolved lazily
 * through a DependencyContext bound to a scope:
 *
 * @code
 * auto provider = weave::di::create_provider([](auto& builder) {
 *     builder.add_singleton<Clock>("clock")
 *         .add_scoped<Session>("session");
 * });
 * auto context = provider->begin();
 * auto session = context.get<Session>("session");
 * @endcode
 */

#include <memory>

#include "container_config.hpp"
#include "dependency_context.hpp"
#include "exotic_context.hpp"
#include "resolve_error.hpp"
#include "service_provider.hpp"
#include "service_registry.hpp"
#include "service_scope.hpp"

namespace weave::di {

/**
 * @brief Create a provider over a registry built by a callback
 */
std::unique_ptr<ServiceProvider> create_provider(
    const ServiceRegistry::BuildFunction& build, ContainerConfig config = {});

/**
 * @brief Create a provider over an existing registry
 */
std::unique_ptr<ServiceProvider> create_provider(
    std::shared_ptr<const ServiceRegistry> registry,
    ContainerConfig config = {});

}  // namespace weave::di
