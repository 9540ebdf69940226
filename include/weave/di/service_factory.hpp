#pragma once

#include <memory>
#include <type_traits>

#include "weave/di/dependency_context.hpp"
#include "weave/di/service_descriptor.hpp"

namespace weave::di {

/**
 * @brief Wrap a constructor into a ServiceFactory
 *
 * TImplementation is built with the DependencyContext when it has such a
 * constructor, otherwise it is default constructed. The instance is stored
 * as std::shared_ptr<TInterface>.
 */
template <typename TInterface, typename TImplementation = TInterface>
ServiceFactory make_constructor_factory() {
    static_assert(
        std::is_base_of_v<TInterface, TImplementation> ||
            std::is_same_v<TInterface, TImplementation>,
        "Implementation must inherit from or be the same as Interface");
    static_assert(
        std::is_constructible_v<TImplementation, DependencyContext&> ||
            std::is_default_constructible_v<TImplementation>,
        "Implementation must be constructible from DependencyContext& or "
        "default constructible");

    return [](DependencyContext& context) -> Instance {
        if constexpr (std::is_constructible_v<TImplementation,
                                              DependencyContext&>) {
            return Instance(std::shared_ptr<TInterface>(
                std::make_shared<TImplementation>(context)));
        } else {
            return Instance(std::shared_ptr<TInterface>(
                std::make_shared<TImplementation>()));
        }
    };
}

/**
 * @brief Wrap a plain callable into a ServiceFactory
 *
 * The callable takes a DependencyContext& or nothing, and returns anything
 * convertible to std::shared_ptr<T>.
 */
template <typename T, typename F>
ServiceFactory make_callable_factory(F factory) {
    static_assert(std::is_invocable_v<const F&, DependencyContext&> ||
                      std::is_invocable_v<const F&>,
                  "Factory must be callable with DependencyContext& or with "
                  "no arguments");

    return [factory = std::move(factory)](DependencyContext& context)
               -> Instance {
        if constexpr (std::is_invocable_v<const F&, DependencyContext&>) {
            return Instance(std::shared_ptr<T>(factory(context)));
        } else {
            return Instance(std::shared_ptr<T>(factory()));
        }
    };
}

}  // namespace weave::di
