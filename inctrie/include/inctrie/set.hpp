#ifndef INCTRIE_SET_HPP
#define INCTRIE_SET_HPP

#include <inctrie/meta.hpp>
#include <inctrie/name.hpp>
#include <inctrie/trie.hpp>
#include <inctrie/trie_fold.hpp>
#include <inctrie/types.hpp>
#include <utility>
#include <vector>

namespace inctrie {

// A set stores (x, Unit) pairs; placement and membership use x alone
template<typename X>
using Set = Trie<std::pair<X, Unit>>;

namespace set {

template<typename X>
Set<X> empty(const Meta& meta = Meta()) {
    return Set<X>::empty(meta);
}

template<typename X>
Set<X> add(const Set<X>& s, non_deduced_t<X> x) {
    return Set<X>::extend(Name::unit(), s, std::pair<X, Unit>{std::move(x), Unit{}});
}

// add, with the new version's identity derived from nm
template<typename X>
Set<X> add_named(const Set<X>& s, const Name& nm, non_deduced_t<X> x) {
    return Set<X>::extend(nm, s, std::pair<X, Unit>{std::move(x), Unit{}});
}

template<typename X>
bool mem(const Set<X>& s, const non_deduced_t<X>& x) {
    std::pair<X, Unit> entry{x, Unit{}};
    return Set<X>::find(s, entry, TrieKey<std::pair<X, Unit>>::hash(entry)).has_value();
}

template<typename X>
bool is_empty(const Set<X>& s) {
    return Set<X>::is_empty(s);
}

// fn(x, acc), each element once, order unspecified
template<typename X, typename Acc, typename Fn>
Acc fold(const Set<X>& s, Acc init, Fn&& fn) {
    return ::inctrie::fold(s, std::move(init), [&fn](const std::pair<X, Unit>& e, Acc acc) {
        return fn(e.first, std::move(acc));
    });
}

// Elements in trie order (by reversed hash bits)
template<typename X>
std::vector<X> elements(const Set<X>& s) {
    using Acc = std::vector<X>;
    return fold_seq(s, Acc{},
        [](const std::pair<X, Unit>& e, Acc acc) {
            acc.push_back(e.first);
            return acc;
        },
        [](Acc acc) { return acc; },
        [](const Name&, Acc acc) { return acc; });
}

} // namespace set
} // namespace inctrie

#endif // INCTRIE_SET_HPP
