#ifndef INCTRIE_TYPES_HPP
#define INCTRIE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <type_traits>
#include <utility>

namespace inctrie {

// Placement hash: one bit consumed per trie level, lowest bit first
using HashValue = uint64_t;

// Maximum bit-string length, i.e. the bit width of HashValue
constexpr std::size_t MAX_LEN = 64;

#ifndef INCTRIE_DEFAULT_MIN_DEPTH
#define INCTRIE_DEFAULT_MIN_DEPTH 1
#endif

constexpr uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

// FNV-1a hash combining
inline uint64_t fnv_hash(uint64_t h, uint64_t value) {
    h ^= value;
    h *= FNV_PRIME;
    return h;
}

// FNV-1a over the bytes of a 64-bit value, then fold the high half down.
// Multiplication only carries upward, and placement reads the low bits first.
inline uint64_t fnv_mix(uint64_t value, uint64_t seed = FNV_OFFSET) {
    uint64_t h = seed;
    for (int i = 0; i < 8; ++i) {
        h = fnv_hash(h, (value >> (i * 8)) & 0xFF);
    }
    return h ^ (h >> 32);
}

/**
 * Payload type for sets: Set<X> is Trie<(X, Unit)>.
 */
struct Unit {
    constexpr bool operator==(const Unit&) const { return true; }
    constexpr bool operator!=(const Unit&) const { return false; }
};

/**
 * Hasher<T>: 64-bit element hash used for placement.
 * Defaults to std::hash<T> run through fnv_mix.
 */
template<typename T>
struct Hasher {
    uint64_t operator()(const T& value) const {
        return fnv_mix(static_cast<uint64_t>(std::hash<T>{}(value)));
    }
};

template<>
struct Hasher<Unit> {
    uint64_t operator()(const Unit&) const { return FNV_OFFSET; }
};

template<typename A, typename B>
struct Hasher<std::pair<A, B>> {
    uint64_t operator()(const std::pair<A, B>& p) const {
        uint64_t h = Hasher<A>{}(p.first);
        return fnv_mix(Hasher<B>{}(p.second), h);
    }
};

/**
 * TrieKey<X>: how an element is placed in a trie.
 *   hash(x)        - placement hash, recomputed on every call
 *   same_key(a, b) - whether a and b occupy the same slot
 * Specialize to change placement for a type.
 */
template<typename X>
struct TrieKey {
    static HashValue hash(const X& x) { return Hasher<X>{}(x); }
    static bool same_key(const X& a, const X& b) { return a == b; }
};

/**
 * Pairs are (key, value) entries: only the key decides placement. This is
 * what makes Trie<(K, V)> a map and Trie<(X, Unit)> a set, and it means a
 * Trie<(A, B)> is never a plain set of pairs: two pairs with equal first
 * components share a slot. Store pairs as Set<(A, B)> (that is,
 * Trie<((A, B), Unit)>) to key on the whole pair.
 *
 * Lookups by key alone go through the key-level hooks:
 *   key_hash(k)          - placement hash of an entry whose key is k
 *   key_matches(kv, k)   - whether entry kv is stored under k
 * A specialization for a particular pair type must provide them as well,
 * consistent with hash and same_key.
 */
template<typename K, typename V>
struct TrieKey<std::pair<K, V>> {
    static HashValue key_hash(const K& k) { return Hasher<K>{}(k); }
    static bool key_matches(const std::pair<K, V>& kv, const K& k) { return kv.first == k; }

    static HashValue hash(const std::pair<K, V>& kv) { return key_hash(kv.first); }
    static bool same_key(const std::pair<K, V>& a, const std::pair<K, V>& b) {
        return key_matches(a, b.first);
    }
};

// Detects operator== on T (memo tables need it to compare arguments)
template<typename T, typename = void>
struct is_equality_comparable : std::false_type {};

template<typename T>
struct is_equality_comparable<T, std::void_t<decltype(std::declval<const T&>() == std::declval<const T&>())>>
    : std::true_type {};

// Keeps a parameter out of template argument deduction
template<typename T>
struct non_deduced {
    using type = T;
};

template<typename T>
using non_deduced_t = typename non_deduced<T>::type;

} // namespace inctrie

namespace std {
    template<>
    struct hash<inctrie::Unit> {
        std::size_t operator()(const inctrie::Unit&) const { return 0; }
    };
}

#endif // INCTRIE_TYPES_HPP
