#pragma once

#include <string>

#include "weave/config/config.hpp"

namespace weave::di {

// Container settings, read from the "container" section
class ContainerConfig : public config::ConfigurationProperties {
public:
    // Also check lifetimes when a scoped service is served from its cache
    bool validate_cached_lifetimes = false;

    // Label given to new scopes, empty for unnamed
    std::string default_scope_name;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    std::string properties_name() const override { return "container"; }
};

}  // namespace weave::di
