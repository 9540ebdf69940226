#include "weave/di/service_registry.hpp"

#include <stdexcept>

#include "weave/di/resolve_error.hpp"

namespace weave::di {

ServiceRegistryBuilder& ServiceRegistryBuilder::add(const std::string& name,
                                                    ServiceLifetime lifetime,
                                                    ServiceFactory factory) {
    if (name.empty()) {
        throw std::invalid_argument("Service name cannot be empty");
    }
    if (!factory) {
        throw std::invalid_argument("Service '" + name +
                                    "' has no factory");
    }

    auto it = descriptors_.find(name);
    if (it == descriptors_.end()) {
        names_.push_back(name);
        descriptors_.emplace(name,
                             ServiceDescriptor{lifetime, std::move(factory)});
    } else {
        it->second = ServiceDescriptor{lifetime, std::move(factory)};
    }
    return *this;
}

bool ServiceRegistryBuilder::has(const std::string& name) const {
    return descriptors_.find(name) != descriptors_.end();
}

std::shared_ptr<const ServiceRegistry> ServiceRegistryBuilder::build() const {
    return std::shared_ptr<const ServiceRegistry>(
        new ServiceRegistry(names_, descriptors_));
}

ServiceRegistry::ServiceRegistry(const BuildFunction& build) {
    ServiceRegistryBuilder builder;
    if (build) {
        build(builder);
    }
    names_ = builder.names_;
    descriptors_ = builder.descriptors_;
}

ServiceRegistry::ServiceRegistry(
    std::vector<std::string> names,
    std::unordered_map<std::string, ServiceDescriptor> descriptors)
    : names_(std::move(names)), descriptors_(std::move(descriptors)) {}

const ServiceDescriptor& ServiceRegistry::get(const std::string& name) const {
    auto it = descriptors_.find(name);
    if (it == descriptors_.end()) {
        throw ResolveError(ResolveError::Kind::UNREGISTERED,
                           "Invalid service name: " + name, {}, {name});
    }
    return it->second;
}

bool ServiceRegistry::has(const std::string& name) const {
    return descriptors_.find(name) != descriptors_.end();
}

}  // namespace weave::di
