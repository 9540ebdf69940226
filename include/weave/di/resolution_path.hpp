#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace weave::di {

/**
 * @brief Names currently under construction in a scope, oldest first
 */
class ResolutionPath {
public:
    void push(const std::string& name) { entries_.push_back(name); }
    void pop();

    // Index of the most recent occurrence of a name
    std::optional<size_t> last_index_of(const std::string& name) const;

    bool contains(const std::string& name) const {
        return last_index_of(name).has_value();
    }

    /**
     * @brief Render the path followed by the requested name
     *
     * The entry at `marked` and the requested name are both bracketed, e.g.
     * "a -> [b] -> c -> [b]".
     */
    std::string describe(size_t marked, const std::string& requested) const;

    const std::vector<std::string>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

private:
    std::vector<std::string> entries_;
};

/**
 * @brief RAII guard that keeps a name on the path while its factory runs
 */
class ResolutionGuard {
public:
    ResolutionGuard(ResolutionPath& path, const std::string& name)
        : path_(path) {
        path_.push(name);
    }

    ~ResolutionGuard() { path_.pop(); }

    ResolutionGuard(const ResolutionGuard&) = delete;
    ResolutionGuard& operator=(const ResolutionGuard&) = delete;

private:
    ResolutionPath& path_;
};

}  // namespace weave::di
