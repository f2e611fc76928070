#ifndef INCTRIE_MAP_HPP
#define INCTRIE_MAP_HPP

#include <inctrie/errors.hpp>
#include <inctrie/meta.hpp>
#include <inctrie/name.hpp>
#include <inctrie/trie.hpp>
#include <inctrie/trie_fold.hpp>
#include <inctrie/types.hpp>
#include <optional>
#include <utility>

namespace inctrie {

// A map stores (key, value) pairs; placement and lookup use the key alone
template<typename K, typename V>
using Map = Trie<std::pair<K, V>>;

namespace map {

template<typename K, typename V>
Map<K, V> empty(const Meta& meta = Meta()) {
    return Map<K, V>::empty(meta);
}

// Insert or replace the binding for k
template<typename K, typename V>
Map<K, V> update(const Map<K, V>& m, non_deduced_t<K> k, non_deduced_t<V> v) {
    return Map<K, V>::extend(Name::unit(), m, std::pair<K, V>{std::move(k), std::move(v)});
}

template<typename K, typename V>
std::optional<V> find(const Map<K, V>& m, const non_deduced_t<K>& k) {
    using Key = TrieKey<std::pair<K, V>>;
    auto found = Map<K, V>::find_by(m, Key::key_hash(k),
        [&k](const std::pair<K, V>& entry) { return Key::key_matches(entry, k); });
    if (!found) {
        return std::nullopt;
    }
    return found->second;
}

template<typename K, typename V>
bool is_empty(const Map<K, V>& m) {
    return Map<K, V>::is_empty(m);
}

template<typename K, typename V>
[[noreturn]] Map<K, V> remove(const Map<K, V>&, const non_deduced_t<K>&) {
    throw UnsupportedOperationError("map::remove is not supported");
}

template<typename K, typename V>
[[noreturn]] Map<K, V> append(const Map<K, V>&, const Map<K, V>&) {
    throw UnsupportedOperationError("map::append is not supported");
}

// fn(k, v, acc), each binding once, order unspecified
template<typename K, typename V, typename Acc, typename Fn>
Acc fold(const Map<K, V>& m, Acc init, Fn&& fn) {
    return ::inctrie::fold(m, std::move(init), [&fn](const std::pair<K, V>& entry, Acc acc) {
        return fn(entry.first, entry.second, std::move(acc));
    });
}

} // namespace map
} // namespace inctrie

#endif // INCTRIE_MAP_HPP
