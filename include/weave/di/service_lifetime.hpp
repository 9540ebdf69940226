#pragma once

#include <string>

namespace weave::di {

/**
 * @brief Service lifetime scope
 */
enum class ServiceLifetime {
    SINGLETON,  // One instance per provider
    SCOPED,     // One instance per scope
    TRANSIENT   // New instance on every access
};

std::string to_string(ServiceLifetime lifetime);
ServiceLifetime lifetime_from_string(const std::string& text);

}  // namespace weave::di
