#include "weave/di/service_lifetime.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace weave::di {

std::string to_string(ServiceLifetime lifetime) {
    switch (lifetime) {
        case ServiceLifetime::SINGLETON:
            return "singleton";
        case ServiceLifetime::SCOPED:
            return "scoped";
        case ServiceLifetime::TRANSIENT:
            return "transient";
    }
    return "unknown";
}

ServiceLifetime lifetime_from_string(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "singleton") return ServiceLifetime::SINGLETON;
    if (lower == "scoped") return ServiceLifetime::SCOPED;
    if (lower == "transient") return ServiceLifetime::TRANSIENT;

    throw std::invalid_argument("Invalid service lifetime: " + text);
}

}  // namespace weave::di
