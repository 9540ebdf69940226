#include "weave/di/exotic_context.hpp"

#include "weave/di/resolve_error.hpp"

namespace weave::di {

ExoticContext& ExoticContext::set(const std::string& name, Accessor accessor) {
    if (entries_.find(name) == entries_.end()) {
        names_.push_back(name);
    }
    entries_[name] = std::move(accessor);
    return *this;
}

bool ExoticContext::contains(const std::string& name) const {
    return entries_.find(name) != entries_.end();
}

Instance ExoticContext::get(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        throw ResolveError(ResolveError::Kind::UNREGISTERED,
                           "Invalid service name: " + name);
    }
    return it->second();
}

}  // namespace weave::di
