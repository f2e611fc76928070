#ifndef INCTRIE_META_HPP
#define INCTRIE_META_HPP

#include <inctrie/types.hpp>
#include <cstddef>
#include <functional>

namespace inctrie {

/**
 * Per-trie configuration, carried by the Root node and fixed at creation.
 * min_depth is the number of branch levels forced before any leaf appears.
 */
struct Meta {
    int min_depth;

    Meta() : min_depth(INCTRIE_DEFAULT_MIN_DEPTH) {}
    explicit Meta(int depth) : min_depth(depth) {}

    // Copy with min_depth clamped to [0, MAX_LEN]; logs a warning when clamping
    Meta clamped() const;

    // min_depth as a path length, clamped without logging
    std::size_t depth_limit() const;

    bool operator==(const Meta& other) const { return min_depth == other.min_depth; }
    bool operator!=(const Meta& other) const { return !(*this == other); }
};

} // namespace inctrie

namespace std {
    template<>
    struct hash<inctrie::Meta> {
        std::size_t operator()(const inctrie::Meta& meta) const {
            return static_cast<std::size_t>(
                inctrie::fnv_mix(static_cast<uint64_t>(meta.min_depth)));
        }
    };
}

#endif // INCTRIE_META_HPP
