#ifndef INCTRIE_TRIE_FOLD_HPP
#define INCTRIE_TRIE_FOLD_HPP

#include <inctrie/engine.hpp>
#include <inctrie/trie.hpp>
#include <inctrie/types.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace inctrie {

/**
 * Unordered fold: leaf_fn(x, acc) once per stored element.
 * Bin folds its right child first, then its left.
 */
template<typename X, typename Acc, typename LeafFn>
Acc fold(const Trie<X>& trie, Acc init, LeafFn&& leaf_fn) {
    using T = Trie<X>;
    return T::elim_arg(trie, std::move(init),
        [](const BitString&, Acc acc) { return acc; },
        [&](const BitString&, const X& x, Acc acc) -> Acc { return leaf_fn(x, std::move(acc)); },
        [&](const BitString&, const T& left, const T& right, Acc acc) -> Acc {
            Acc after_right = ::inctrie::fold(right, std::move(acc), leaf_fn);
            return ::inctrie::fold(left, std::move(after_right), leaf_fn);
        },
        [&](const Meta&, const T& inner, Acc acc) -> Acc { return ::inctrie::fold(inner, std::move(acc), leaf_fn); },
        [&](const Name&, const T& inner, Acc acc) -> Acc { return ::inctrie::fold(inner, std::move(acc), leaf_fn); });
}

namespace detail {

// Program point of one fold instantiation: the fold's name plus the types of
// its handlers. Every lambda has its own type, so two folds written at
// different call sites never share memo entries.
template<typename LeafFn, typename BinFn, typename NameFn>
std::string fold_program_point(const char* fold_name) {
    std::string pt(fold_name);
    pt += '/';
    pt += typeid(std::decay_t<LeafFn>).name();
    pt += '/';
    pt += typeid(std::decay_t<BinFn>).name();
    pt += '/';
    pt += typeid(std::decay_t<NameFn>).name();
    return pt;
}

// Runs compute() through engine's memo table under nm when the accumulator
// can be compared; otherwise (or without an engine) just runs it.
template<typename Res, typename X, typename Acc, typename Fn>
Res memo_named_fold(Engine* engine, const Name& nm, const std::string& prog_pt,
                    const Trie<X>& inner, const Acc& acc, Fn&& compute) {
    if constexpr (is_equality_comparable<Acc>::value) {
        if (engine) {
            using Arg = std::pair<Trie<X>, Acc>;
            return engine->memo<Res>(nm, prog_pt, Arg{inner, acc},
                [](const Arg& stored, const Arg& current) {
                    return stored.first.same(current.first) && stored.second == current.second;
                },
                compute);
        }
    }
    return compute();
}

} // namespace detail

/**
 * In-order fold.
 *   Bin(l, r)   fold l, then bin_fn(acc), then fold r
 *   Name(nm, t) fold t (memoized under nm when engine is given), then name_fn(nm, acc)
 *
 * Memo entries are keyed by nm and by the handler types. Handlers of one
 * type whose results depend on captured state must run under distinct
 * Engine::ns scopes when that state differs.
 */
template<typename X, typename Acc, typename LeafFn, typename BinFn, typename NameFn>
Acc fold_seq(const Trie<X>& trie, Acc init, LeafFn&& leaf_fn, BinFn&& bin_fn, NameFn&& name_fn,
             Engine* engine = nullptr) {
    using T = Trie<X>;
    static const std::string prog_pt = detail::fold_program_point<LeafFn, BinFn, NameFn>("fold_seq");
    return T::elim_arg(trie, std::move(init),
        [](const BitString&, Acc acc) { return acc; },
        [&](const BitString&, const X& x, Acc acc) -> Acc { return leaf_fn(x, std::move(acc)); },
        [&](const BitString&, const T& left, const T& right, Acc acc) -> Acc {
            Acc after_left = fold_seq(left, std::move(acc), leaf_fn, bin_fn, name_fn, engine);
            Acc between = bin_fn(std::move(after_left));
            return fold_seq(right, std::move(between), leaf_fn, bin_fn, name_fn, engine);
        },
        [&](const Meta&, const T& inner, Acc acc) -> Acc {
            return fold_seq(inner, std::move(acc), leaf_fn, bin_fn, name_fn, engine);
        },
        [&](const Name& nm, const T& inner, Acc acc) -> Acc {
            Acc folded = detail::memo_named_fold<Acc>(engine, nm, prog_pt, inner, acc, [&]() {
                return fold_seq(inner, acc, leaf_fn, bin_fn, name_fn, engine);
            });
            return name_fn(nm, std::move(folded));
        });
}

/**
 * In-order fold that also hands each leaf the most recently entered Name,
 * if no earlier leaf has consumed it:
 *   leaf_fn(x, std::optional<Name>, acc)
 * A Name therefore tags at most one element, the first one below it.
 * Memoized like fold_seq, under its own program point.
 */
template<typename X, typename Acc, typename LeafFn, typename BinFn, typename NameFn>
Acc fold_seq_nm(const Trie<X>& trie, Acc init, LeafFn&& leaf_fn, BinFn&& bin_fn, NameFn&& name_fn,
                Engine* engine = nullptr) {
    using T = Trie<X>;
    using State = std::pair<Acc, std::optional<Name>>;
    static const std::string prog_pt = detail::fold_program_point<LeafFn, BinFn, NameFn>("fold_seq_nm");

    struct Walker {
        LeafFn& leaf_fn;
        BinFn& bin_fn;
        NameFn& name_fn;
        Engine* engine;
        const std::string& prog_pt;

        State run(const T& t, State st) {
            return T::elim_arg(t, std::move(st),
                [](const BitString&, State s) { return s; },
                [&](const BitString&, const X& x, State s) -> State {
                    Acc next = leaf_fn(x, std::move(s.second), std::move(s.first));
                    return State{std::move(next), std::nullopt};
                },
                [&](const BitString&, const T& left, const T& right, State s) -> State {
                    State after_left = run(left, std::move(s));
                    after_left.first = bin_fn(std::move(after_left.first));
                    return run(right, std::move(after_left));
                },
                [&](const Meta&, const T& inner, State s) -> State { return run(inner, std::move(s)); },
                [&](const Name& nm, const T& inner, State s) -> State {
                    // Entering a Name supersedes any pending one
                    State entered{std::move(s.first), nm};
                    State folded = detail::memo_named_fold<State>(engine, nm, prog_pt, inner,
                                                                  entered.first, [&]() {
                        return run(inner, entered);
                    });
                    folded.first = name_fn(nm, std::move(folded.first));
                    return folded;
                });
        }
    };

    Walker walker{leaf_fn, bin_fn, name_fn, engine, prog_pt};
    return walker.run(trie, State{std::move(init), std::nullopt}).first;
}

/**
 * Bottom-up, shape-preserving fold. Every node is visited once and replaced
 * by the result of its handler; Art is forced and otherwise invisible.
 */
template<typename X, typename NilFn, typename LeafFn, typename BinFn, typename RootFn, typename NameFn>
auto fold_up(const Trie<X>& trie, NilFn&& nil_fn, LeafFn&& leaf_fn, BinFn&& bin_fn,
             RootFn&& root_fn, NameFn&& name_fn)
    -> std::invoke_result_t<NilFn&, const BitString&> {
    using T = Trie<X>;
    using R = std::invoke_result_t<NilFn&, const BitString&>;
    return T::elim_ref(trie,
        [&](const BitString& bs) -> R { return nil_fn(bs); },
        [&](const BitString& bs, const X& x) -> R { return leaf_fn(bs, x); },
        [&](const BitString& bs, const T& left, const T& right) -> R {
            R l = fold_up(left, nil_fn, leaf_fn, bin_fn, root_fn, name_fn);
            R r = fold_up(right, nil_fn, leaf_fn, bin_fn, root_fn, name_fn);
            return bin_fn(bs, std::move(l), std::move(r));
        },
        [&](const Meta& meta, const T& inner) -> R {
            return root_fn(meta, fold_up(inner, nil_fn, leaf_fn, bin_fn, root_fn, name_fn));
        },
        [&](const Name& nm, const T& inner) -> R {
            return name_fn(nm, fold_up(inner, nil_fn, leaf_fn, bin_fn, root_fn, name_fn));
        });
}

// Same trie rebuilt without any Name or Art node
template<typename X>
Trie<X> canonical(const Trie<X>& trie) {
    using T = Trie<X>;
    return fold_up(trie,
        [](const BitString& bs) { return T::nil(bs); },
        [](const BitString& bs, const X& x) { return T::leaf(bs, x); },
        [](const BitString& bs, T left, T right) { return T::bin(bs, std::move(left), std::move(right)); },
        [](const Meta& meta, T inner) { return T::root(meta, std::move(inner)); },
        [](const Name&, T inner) { return inner; });
}

// Number of stored elements
template<typename X>
std::size_t element_count(const Trie<X>& trie) {
    return fold(trie, std::size_t{0}, [](const X&, std::size_t n) { return n + 1; });
}

} // namespace inctrie

#endif // INCTRIE_TRIE_FOLD_HPP
