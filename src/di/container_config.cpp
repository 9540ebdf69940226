#include "weave/di/container_config.hpp"

namespace weave::di {

void ContainerConfig::from_ptree(const boost::property_tree::ptree& pt) {
    validate_cached_lifetimes = get_value(pt, "validate_cached_lifetimes",
                                          validate_cached_lifetimes);
    default_scope_name =
        get_value(pt, "default_scope_name", default_scope_name);
}

}  // namespace weave::di
