#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace weave::di {

/**
 * @brief Raised for every resolution failure detected by the container
 *
 * The path holds the service names that were being resolved when the
 * failure happened, with the requested name last.
 */
class ResolveError : public std::runtime_error {
public:
    enum class Kind {
        UNREGISTERED,
        INVALID_NAME,
        CIRCULAR_REFERENCE,
        LIFETIME_EXCEEDED,
        TYPE_MISMATCH,
        SCOPE_EXPIRED
    };

    ResolveError(Kind kind, const std::string& message,
                 std::string scope_name = {},
                 std::vector<std::string> path = {})
        : std::runtime_error(message),
          kind_(kind),
          scope_name_(std::move(scope_name)),
          path_(std::move(path)) {}

    Kind kind() const { return kind_; }
    const std::string& scope_name() const { return scope_name_; }
    const std::vector<std::string>& path() const { return path_; }

private:
    Kind kind_;
    std::string scope_name_;
    std::vector<std::string> path_;
};

}  // namespace weave::di
