#pragma once

#include <boost/any.hpp>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>

#include "weave/di/service_lifetime.hpp"

namespace weave::di {

class DependencyContext;

// A resolved service: a std::shared_ptr<T> behind boost::any, or empty
using Instance = boost::any;

// Resolved instances keyed by service name
using InstanceMap = std::map<std::string, Instance>;

// Instance cache owned by a provider (singletons) or a scope (scoped)
using InstanceCache = std::unordered_map<std::string, Instance>;

using ServiceFactory = std::function<Instance(DependencyContext&)>;

/**
 * @brief Lifetime and factory registered under one service name
 */
struct ServiceDescriptor {
    ServiceLifetime lifetime;
    ServiceFactory create;
};

}  // namespace weave::di
