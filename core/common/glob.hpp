#pragma once

#include <fnmatch.h>

#include <string>

namespace hearth {

// Shell-style match ("lamp*", "plugins:*"). Used by binding selectors and cache invalidation.
inline bool glob_match(const std::string &pattern, const std::string &text) {
    return fnmatch(pattern.c_str(), text.c_str(), 0) == 0;
}

}  // namespace hearth
