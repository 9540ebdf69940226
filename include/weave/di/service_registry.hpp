#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "weave/di/service_descriptor.hpp"
#include "weave/di/service_factory.hpp"

namespace weave::di {

class ServiceRegistry;

/**
 * @brief Collects service descriptors before they are frozen into a registry
 *
 * Each lifetime has two entry points: one taking the implementation type,
 * which is constructed by the container, and one taking a factory callable.
 * Registering a name again replaces its descriptor and keeps its position.
 */
class ServiceRegistryBuilder {
public:
    template <typename TInterface, typename TImplementation = TInterface>
    ServiceRegistryBuilder& add_singleton(const std::string& name) {
        return add(name, ServiceLifetime::SINGLETON,
                   make_constructor_factory<TInterface, TImplementation>());
    }

    template <typename T, typename F>
    ServiceRegistryBuilder& add_singleton(const std::string& name, F factory) {
        return add(name, ServiceLifetime::SINGLETON,
                   make_callable_factory<T>(std::move(factory)));
    }

    template <typename TInterface, typename TImplementation = TInterface>
    ServiceRegistryBuilder& add_scoped(const std::string& name) {
        return add(name, ServiceLifetime::SCOPED,
                   make_constructor_factory<TInterface, TImplementation>());
    }

    template <typename T, typename F>
    ServiceRegistryBuilder& add_scoped(const std::string& name, F factory) {
        return add(name, ServiceLifetime::SCOPED,
                   make_callable_factory<T>(std::move(factory)));
    }

    template <typename TInterface, typename TImplementation = TInterface>
    ServiceRegistryBuilder& add_transient(const std::string& name) {
        return add(name, ServiceLifetime::TRANSIENT,
                   make_constructor_factory<TInterface, TImplementation>());
    }

    template <typename T, typename F>
    ServiceRegistryBuilder& add_transient(const std::string& name, F factory) {
        return add(name, ServiceLifetime::TRANSIENT,
                   make_callable_factory<T>(std::move(factory)));
    }

    // Register an already wrapped factory
    ServiceRegistryBuilder& add(const std::string& name,
                                ServiceLifetime lifetime,
                                ServiceFactory factory);

    bool has(const std::string& name) const;
    size_t size() const { return names_.size(); }

    std::shared_ptr<const ServiceRegistry> build() const;

private:
    friend class ServiceRegistry;

    std::vector<std::string> names_;
    std::unordered_map<std::string, ServiceDescriptor> descriptors_;
};

/**
 * @brief Immutable mapping from service name to descriptor
 */
class ServiceRegistry {
public:
    using BuildFunction = std::function<void(ServiceRegistryBuilder&)>;

    explicit ServiceRegistry(const BuildFunction& build);

    // Registered names in registration order
    const std::vector<std::string>& names() const { return names_; }

    /**
     * @brief Get the descriptor registered under a name
     * @throws ResolveError if the name is not registered
     */
    const ServiceDescriptor& get(const std::string& name) const;

    bool has(const std::string& name) const;
    size_t size() const { return names_.size(); }

private:
    friend class ServiceRegistryBuilder;

    ServiceRegistry(
        std::vector<std::string> names,
        std::unordered_map<std::string, ServiceDescriptor> descriptors);

    std::vector<std::string> names_;
    std::unordered_map<std::string, ServiceDescriptor> descriptors_;
};

}  // namespace weave::di
