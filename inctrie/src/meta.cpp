#include <inctrie/meta.hpp>
#include <inctrie/debug_log.hpp>

namespace inctrie {

Meta Meta::clamped() const {
    const int max_depth = static_cast<int>(MAX_LEN);
    if (min_depth > max_depth) {
        WARN_LOG("Cannot make a trie with min_depth > %d (given %d), using %d",
                 max_depth, min_depth, max_depth);
        return Meta(max_depth);
    }
    if (min_depth < 0) {
        WARN_LOG("Cannot make a trie with negative min_depth (given %d), using 0", min_depth);
        return Meta(0);
    }
    return *this;
}

std::size_t Meta::depth_limit() const {
    if (min_depth < 0) return 0;
    if (static_cast<std::size_t>(min_depth) > MAX_LEN) return MAX_LEN;
    return static_cast<std::size_t>(min_depth);
}

} // namespace inctrie
