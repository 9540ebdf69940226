#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "weave/di/service_descriptor.hpp"

namespace weave::di {

/**
 * @brief Caller-supplied entries layered over a scope's services
 *
 * Entries never reach the registry or the scope caches. A value entry
 * yields the same instance on every access; an accessor entry is invoked
 * on every access.
 */
class ExoticContext {
public:
    using Accessor = std::function<Instance()>;

    template <typename T>
    ExoticContext& set_value(const std::string& name,
                             std::shared_ptr<T> value) {
        return set(name, [instance = Instance(std::move(value))]() {
            return instance;
        });
    }

    template <typename T, typename F>
    ExoticContext& set_accessor(const std::string& name, F accessor) {
        return set(name, [accessor = std::move(accessor)]() -> Instance {
            return Instance(std::shared_ptr<T>(accessor()));
        });
    }

    bool contains(const std::string& name) const;
    Instance get(const std::string& name) const;

    const std::vector<std::string>& names() const { return names_; }
    size_t size() const { return names_.size(); }

private:
    ExoticContext& set(const std::string& name, Accessor accessor);

    std::vector<std::string> names_;
    std::unordered_map<std::string, Accessor> entries_;
};

}  // namespace weave::di
