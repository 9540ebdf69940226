#pragma once

#include <boost/any.hpp>
#include <boost/type_index.hpp>
#include <memory>
#include <string>

#include "weave/di/resolve_error.hpp"
#include "weave/di/service_descriptor.hpp"

namespace weave::di {

class ExoticContext;
class ServiceScope;

/**
 * @brief Lazy, name-indexed view over a scope
 *
 * Nothing is constructed until a name is accessed. The context keeps no
 * cache of its own: every access goes to the exotic entries first and then
 * to the scope, which caches by lifetime. Copies are handles onto the same
 * scope and exotic entries.
 *
 * Contexts made by a scope or a provider keep the scope alive. The context
 * handed to a factory is a non-owning view of the caller's context, so a
 * service that stores it does not keep its scope alive; once the scope is
 * gone, lookups through the stored view throw ResolveError.
 */
class DependencyContext {
public:
    // Reserved name that always resolves to an empty instance
    static constexpr const char* THENABLE_PROBE = "then";

    explicit DependencyContext(
        std::shared_ptr<ServiceScope> scope,
        std::shared_ptr<const ExoticContext> exotic = nullptr);

    // Same scope and exotic entries, without keeping the scope alive
    DependencyContext non_owning() const;

    bool owns_scope() const { return static_cast<bool>(owner_); }
    bool expired() const { return scope_.expired(); }

    /**
     * @brief Resolve a service by name
     * @throws ResolveError on an invalid name or a resolution failure
     */
    Instance resolve(const std::string& name);

    Instance operator[](const std::string& name) { return resolve(name); }

    /**
     * @brief Resolve a service and cast it to the registered type
     * @return nullptr for an empty instance
     * @throws ResolveError if the service was registered with another type
     */
    template <typename T>
    std::shared_ptr<T> get(const std::string& name) {
        Instance instance = resolve(name);
        if (instance.empty()) {
            return nullptr;
        }
        if (auto* typed = boost::any_cast<std::shared_ptr<T>>(&instance)) {
            return *typed;
        }
        throw ResolveError(
            ResolveError::Kind::TYPE_MISMATCH,
            "Service '" + name + "' is not of type " +
                boost::typeindex::type_id<T>().pretty_name());
    }

    // True if the name is an exotic entry or a registered service
    bool has(const std::string& name) const;

    /**
     * @brief Resolve every exotic entry and every registered service
     *
     * Construction runs over the exotic names first and then the registered
     * names in registration order. The returned map is sorted by name.
     */
    InstanceMap resolve_all();

    // @throws ResolveError if the scope has expired
    ServiceScope& scope() const { return *lock_scope(); }
    const ExoticContext* exotic() const { return exotic_.get(); }

private:
    DependencyContext(std::weak_ptr<ServiceScope> scope,
                      std::shared_ptr<const ExoticContext> exotic);

    std::shared_ptr<ServiceScope> lock_scope() const;

    // Null for a non-owning view
    std::shared_ptr<ServiceScope> owner_;
    std::weak_ptr<ServiceScope> scope_;
    std::shared_ptr<const ExoticContext> exotic_;
};

}  // namespace weave::di
