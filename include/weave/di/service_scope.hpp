#pragma once

#include <memory>
#include <optional>
#include <string>

#include "weave/di/container_config.hpp"
#include "weave/di/dependency_context.hpp"
#include "weave/di/exotic_context.hpp"
#include "weave/di/resolution_path.hpp"
#include "weave/di/service_registry.hpp"

namespace weave::di {

/**
 * @brief Resolution boundary with its own scoped-instance cache
 *
 * A scope shares the registry and the singleton cache of the provider that
 * created it. It is not thread-safe: resolutions on one provider must not
 * run concurrently.
 */
class ServiceScope : public std::enable_shared_from_this<ServiceScope> {
public:
    ServiceScope(std::shared_ptr<const ServiceRegistry> registry,
                 std::shared_ptr<InstanceCache> singletons,
                 ContainerConfig config = {});

    ServiceScope(const ServiceScope&) = delete;
    ServiceScope& operator=(const ServiceScope&) = delete;

    // Debug label used in error messages
    const std::optional<std::string>& name() const { return name_; }
    void set_name(std::optional<std::string> name) { name_ = std::move(name); }

    DependencyContext create_context();
    DependencyContext create_context(ExoticContext exotic);

    /**
     * @brief Resolve a service, constructing it on a cache miss
     *
     * The factory receives a non-owning view of `context`, so lookups made
     * by the factory resolve through this scope as well.
     *
     * @throws ResolveError for an unregistered name, a circular resolution,
     *         or a shorter-lived service requested while a singleton is
     *         under construction
     */
    Instance resolve(const std::string& name, DependencyContext& context);

    const ServiceRegistry& registry() const { return *registry_; }
    const ResolutionPath& resolution_path() const { return path_; }
    size_t scoped_count() const { return scoped_.size(); }

private:
    // "/name/ " or "/(unnamed)/ "
    std::string label() const;

    void throw_if_circular_referenced(const std::string& name) const;
    void throw_if_lifetime_exceeded(const std::string& name) const;
    [[noreturn]] void fail(ResolveError::Kind kind, const std::string& message,
                           const std::string& name) const;

    Instance create(const std::string& name,
                    const ServiceDescriptor& descriptor,
                    DependencyContext& context);

    std::shared_ptr<const ServiceRegistry> registry_;
    std::shared_ptr<InstanceCache> singletons_;
    ContainerConfig config_;
    InstanceCache scoped_;
    ResolutionPath path_;
    std::optional<std::string> name_;
};

}  // namespace weave::di
