#include "weave/di/resolution_path.hpp"

namespace weave::di {

void ResolutionPath::pop() {
    if (!entries_.empty()) {
        entries_.pop_back();
    }
}

std::optional<size_t> ResolutionPath::last_index_of(
    const std::string& name) const {
    for (size_t index = entries_.size(); index > 0; --index) {
        if (entries_[index - 1] == name) {
            return index - 1;
        }
    }
    return std::nullopt;
}

std::string ResolutionPath::describe(size_t marked,
                                     const std::string& requested) const {
    std::string text;
    for (size_t index = 0; index < entries_.size(); ++index) {
        if (index == marked) {
            text += "[" + entries_[index] + "]";
        } else {
            text += entries_[index];
        }
        text += " -> ";
    }
    text += "[" + requested + "]";
    return text;
}

}  // namespace weave::di
