#ifndef INCTRIE_TRIE_HPP
#define INCTRIE_TRIE_HPP

#include <inctrie/art.hpp>
#include <inctrie/bitstring.hpp>
#include <inctrie/debug_log.hpp>
#include <inctrie/errors.hpp>
#include <inctrie/meta.hpp>
#include <inctrie/name.hpp>
#include <inctrie/types.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace inctrie {

enum class NodeKind : uint8_t {
    NIL,
    LEAF,
    BIN,
    ROOT,
    NAME,
    ART
};

inline const char* node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::NIL: return "Nil";
        case NodeKind::LEAF: return "Leaf";
        case NodeKind::BIN: return "Bin";
        case NodeKind::ROOT: return "Root";
        case NodeKind::NAME: return "Name";
        case NodeKind::ART: return "Art";
    }
    return "?";
}

/**
 * Probabilistically balanced binary hash trie with naming hooks.
 *
 * A Trie is an immutable handle on a shared node. Nodes are one of
 *   Nil(bs)            empty subtree at path bs
 *   Leaf(bs, x)        one element at path bs
 *   Bin(bs, l, r)      branch at path bs
 *   Root(meta, t)      top of an independently built trie
 *   Name(nm, t)        stable identity for the subtree t
 *   Art(a)             articulation; forcing it yields a Trie
 *
 * Elements are placed by TrieKey<X>::hash, one low bit per level (even goes
 * left, odd goes right). For X = std::pair<K, V> only the first component
 * is hashed and compared, so Trie<(K, V)> behaves as a map from K; see
 * TrieKey in types.hpp. Every operation returns a new value; subtrees that
 * an operation does not descend into are shared, not copied.
 *
 * Equality and std::hash look through Name and Art, so two tries holding
 * the same elements under the same Meta compare equal whatever order the
 * elements were added in and wherever caching wrappers sit.
 */
template<typename X>
class Trie {
public:
    using Element = X;

    struct NilNode;
    struct LeafNode;
    struct BinNode;
    struct RootNode;
    struct NameNode;
    struct ArtNode;
    struct Node;

    // Nil at the zero-length path
    Trie();

    // === Introduction ===

    static Trie nil(const BitString& bs);
    static Trie leaf(const BitString& bs, X x);
    static Trie bin(const BitString& bs, Trie left, Trie right);
    static Trie root(const Meta& meta, Trie trie);
    static Trie name(const Name& nm, Trie trie);
    static Trie art(Art<Trie> a);

    /**
     * Fresh empty trie:
     *   Name(n1, Art(Root(meta, Name(n2, Art(Nil(bs0))))))
     * with (n1, n2) forked from a fixed base name. meta.min_depth is clamped
     * to [0, MAX_LEN] with a warning.
     */
    static Trie empty(const Meta& meta);

    static Trie singleton(const Meta& meta, const Name& nm, X x);

    /**
     * Insert elt, producing a new trie. trie must be Name(_, Art(...)) whose
     * articulation resolves, possibly through more Name(_, Art(...)) layers,
     * to Root(meta, subtree). The result is
     *   Name(nm_root, Art(Root(meta, Name(nm_rec, Art(subtree')))))
     * where (nm_root, nm_rec) = nm.fork().
     *
     * Re-inserting an element equal to a stored one leaves that leaf as is;
     * an element with the same key but a different value replaces it.
     *
     * @throws MalformedTrieError on any other entry shape
     * @throws HashExhaustedError if two distinct keys collide on all MAX_LEN bits
     */
    static Trie extend(const Name& nm, const Trie& trie, X elt);

    // === Elimination ===

    // Element equal to elt, descending by successive low bits of hash_index
    static std::optional<X> find(const Trie& trie, const X& elt, HashValue hash_index);

    // Same descent, accepting the leaf element for which pred holds
    template<typename Pred>
    static std::optional<X> find_by(const Trie& trie, HashValue hash_index, Pred&& pred);

    static bool is_empty(const Trie& trie);

    /**
     * Turn Leaf(bs, e) into a Bin whose child selected by the next bit of
     * e's hash holds e. Nil and Bin are returned unchanged.
     * @throws MalformedTrieError for Root, Name and Art
     */
    static Trie split_atomic(const Trie& trie);

    /**
     * Structural dispatch. Art nodes are forced (repeatedly) before
     * dispatching, so no handler ever sees one. Name and Root are handed to
     * their handlers unchanged.
     *
     *   elim      handlers take values
     *   elim_arg  handlers take values plus arg, moved through
     *   elim_ref  handlers take const references into trie
     */
    template<typename NilC, typename LeafC, typename BinC, typename RootC, typename NameC>
    static auto elim(const Trie& trie, NilC&& nil_c, LeafC&& leaf_c, BinC&& bin_c,
                     RootC&& root_c, NameC&& name_c)
        -> std::invoke_result_t<NilC&, BitString>;

    template<typename Arg, typename NilC, typename LeafC, typename BinC, typename RootC, typename NameC>
    static auto elim_arg(const Trie& trie, Arg arg, NilC&& nil_c, LeafC&& leaf_c, BinC&& bin_c,
                         RootC&& root_c, NameC&& name_c)
        -> std::invoke_result_t<NilC&, BitString, Arg>;

    template<typename NilC, typename LeafC, typename BinC, typename RootC, typename NameC>
    static auto elim_ref(const Trie& trie, NilC&& nil_c, LeafC&& leaf_c, BinC&& bin_c,
                         RootC&& root_c, NameC&& name_c)
        -> std::invoke_result_t<NilC&, const BitString&>;

    // === Inspection ===

    // Kind of this node, without forcing
    NodeKind kind() const;

    // First node that is not Art, forcing as needed; never past a Name
    const Trie& forced() const;

    const Node& node() const { return *node_; }

    // Node identity
    bool same(const Trie& other) const { return node_ == other.node_; }

    bool operator==(const Trie& other) const;
    bool operator!=(const Trie& other) const { return !(*this == other); }

    // Hash consistent with operator==
    uint64_t structural_hash() const;

private:
    explicit Trie(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

    template<typename Alt>
    static Trie make(Alt&& alt);

    // Skips Art and Name wrappers
    const Trie& unwrapped() const;

    static const RootNode& find_root(const Trie& trie);
    static Trie place(const Meta& meta, const Trie& trie, const BitString& bs, X elt, HashValue hash);
    static bool equal_nodes(const Trie& a, const Trie& b);

    std::shared_ptr<const Node> node_;
};

// =============================================================================
// Nodes
// =============================================================================

template<typename X>
struct Trie<X>::NilNode {
    BitString bs;
};

template<typename X>
struct Trie<X>::LeafNode {
    BitString bs;
    X elt;
};

template<typename X>
struct Trie<X>::BinNode {
    BitString bs;
    Trie<X> left;
    Trie<X> right;
};

template<typename X>
struct Trie<X>::RootNode {
    Meta meta;
    Trie<X> trie;
};

template<typename X>
struct Trie<X>::NameNode {
    Name name;
    Trie<X> trie;
};

template<typename X>
struct Trie<X>::ArtNode {
    Art<Trie<X>> art;
};

// Alternative order matches NodeKind
template<typename X>
struct Trie<X>::Node {
    std::variant<NilNode, LeafNode, BinNode, RootNode, NameNode, ArtNode> value;
};

// =============================================================================
// Introduction
// =============================================================================

template<typename X>
template<typename Alt>
Trie<X> Trie<X>::make(Alt&& alt) {
    return Trie(std::make_shared<const Node>(Node{std::forward<Alt>(alt)}));
}

template<typename X>
Trie<X>::Trie() : node_(std::make_shared<const Node>(Node{NilNode{BitString::empty()}})) {}

template<typename X>
Trie<X> Trie<X>::nil(const BitString& bs) {
    return make(NilNode{bs});
}

template<typename X>
Trie<X> Trie<X>::leaf(const BitString& bs, X x) {
    return make(LeafNode{bs, std::move(x)});
}

template<typename X>
Trie<X> Trie<X>::bin(const BitString& bs, Trie left, Trie right) {
    return make(BinNode{bs, std::move(left), std::move(right)});
}

template<typename X>
Trie<X> Trie<X>::root(const Meta& meta, Trie trie) {
    return make(RootNode{meta, std::move(trie)});
}

template<typename X>
Trie<X> Trie<X>::name(const Name& nm, Trie trie) {
    return make(NameNode{nm, std::move(trie)});
}

template<typename X>
Trie<X> Trie<X>::art(Art<Trie> a) {
    return make(ArtNode{std::move(a)});
}

template<typename X>
Trie<X> Trie<X>::empty(const Meta& meta) {
    Meta checked = meta.clamped();
    auto names = Name::of_str("empty").fork();
    Trie inner = name(names.second, art(Art<Trie>::put(nil(BitString::empty()))));
    return name(names.first, art(Art<Trie>::put(root(checked, std::move(inner)))));
}

template<typename X>
Trie<X> Trie<X>::singleton(const Meta& meta, const Name& nm, X x) {
    return extend(nm, empty(meta), std::move(x));
}

template<typename X>
const typename Trie<X>::RootNode& Trie<X>::find_root(const Trie& trie) {
    const Trie* current = &trie;
    for (;;) {
        const auto* named = std::get_if<NameNode>(&current->node_->value);
        if (!named) {
            throw MalformedTrieError(std::string("extend expects a Name node at entry, found ") +
                                     node_kind_name(current->kind()));
        }
        const auto* articulated = std::get_if<ArtNode>(&named->trie.node_->value);
        if (!articulated) {
            throw MalformedTrieError(std::string("extend expects an Art under the entry Name, found ") +
                                     node_kind_name(named->trie.kind()));
        }
        const Trie& inner = articulated->art.force();
        if (const auto* top = std::get_if<RootNode>(&inner.node_->value)) {
            return *top;
        }
        if (inner.kind() != NodeKind::NAME) {
            throw MalformedTrieError(std::string("extend expects a Root behind the entry articulation, found ") +
                                     node_kind_name(inner.kind()));
        }
        current = &inner;
    }
}

template<typename X>
Trie<X> Trie<X>::place(const Meta& meta, const Trie& trie, const BitString& bs, X elt, HashValue hash) {
    const auto& value = trie.node_->value;

    if (std::holds_alternative<NilNode>(value)) {
        if (bs.length < meta.depth_limit()) {
            BitString bs0 = BitString::prepend(0, bs);
            BitString bs1 = BitString::prepend(1, bs);
            if ((hash & 1) == 0) {
                return bin(bs, place(meta, nil(bs0), bs0, std::move(elt), hash >> 1), nil(bs1));
            }
            return bin(bs, nil(bs0), place(meta, nil(bs1), bs1, std::move(elt), hash >> 1));
        }
        return leaf(bs, std::move(elt));
    }

    if (const auto* lf = std::get_if<LeafNode>(&value)) {
        if (TrieKey<X>::same_key(lf->elt, elt)) {
            if (lf->elt == elt) {
                return trie;
            }
            return leaf(bs, std::move(elt));
        }
        if (bs.is_full()) {
            throw HashExhaustedError("two distinct keys share all " + std::to_string(MAX_LEN) +
                                     " placement bits", bs.length);
        }
        DEBUG_LOG("split leaf at path %s", bs.to_string().c_str());
        return place(meta, split_atomic(trie), bs, std::move(elt), hash);
    }

    if (const auto* br = std::get_if<BinNode>(&value)) {
        if ((hash & 1) == 0) {
            Trie left = place(meta, br->left, BitString::prepend(0, bs), std::move(elt), hash >> 1);
            return bin(bs, std::move(left), br->right);
        }
        Trie right = place(meta, br->right, BitString::prepend(1, bs), std::move(elt), hash >> 1);
        return bin(bs, br->left, std::move(right));
    }

    if (const auto* named = std::get_if<NameNode>(&value)) {
        return place(meta, named->trie, bs, std::move(elt), hash);
    }

    if (const auto* articulated = std::get_if<ArtNode>(&value)) {
        return place(meta, articulated->art.force(), bs, std::move(elt), hash);
    }

    throw MalformedTrieError("Root found below the top of a trie during extend");
}

template<typename X>
Trie<X> Trie<X>::extend(const Name& nm, const Trie& trie, X elt) {
    auto names = nm.fork();
    const Name& nm_root = names.first;
    const Name& nm_rec = names.second;

    const RootNode& top = find_root(trie);
    HashValue hash = TrieKey<X>::hash(elt);
    Trie updated = place(top.meta, top.trie, BitString::empty(), std::move(elt), hash);

    Trie rooted = root(top.meta, name(nm_rec, art(Art<Trie>::put(std::move(updated)))));
    return name(nm_root, art(Art<Trie>::put(std::move(rooted))));
}

// =============================================================================
// Elimination
// =============================================================================

template<typename X>
const Trie<X>& Trie<X>::forced() const {
    const Trie* current = this;
    while (const auto* articulated = std::get_if<ArtNode>(&current->node_->value)) {
        current = &articulated->art.force();
    }
    return *current;
}

template<typename X>
template<typename NilC, typename LeafC, typename BinC, typename RootC, typename NameC>
auto Trie<X>::elim(const Trie& trie, NilC&& nil_c, LeafC&& leaf_c, BinC&& bin_c,
                   RootC&& root_c, NameC&& name_c)
    -> std::invoke_result_t<NilC&, BitString> {
    const auto& value = trie.forced().node_->value;
    switch (value.index()) {
        case 0: {
            const auto& n = std::get<NilNode>(value);
            return nil_c(n.bs);
        }
        case 1: {
            const auto& n = std::get<LeafNode>(value);
            return leaf_c(n.bs, n.elt);
        }
        case 2: {
            const auto& n = std::get<BinNode>(value);
            return bin_c(n.bs, n.left, n.right);
        }
        case 3: {
            const auto& n = std::get<RootNode>(value);
            return root_c(n.meta, n.trie);
        }
        default: {
            const auto& n = std::get<NameNode>(value);
            return name_c(n.name, n.trie);
        }
    }
}

template<typename X>
template<typename Arg, typename NilC, typename LeafC, typename BinC, typename RootC, typename NameC>
auto Trie<X>::elim_arg(const Trie& trie, Arg arg, NilC&& nil_c, LeafC&& leaf_c, BinC&& bin_c,
                       RootC&& root_c, NameC&& name_c)
    -> std::invoke_result_t<NilC&, BitString, Arg> {
    const auto& value = trie.forced().node_->value;
    switch (value.index()) {
        case 0: {
            const auto& n = std::get<NilNode>(value);
            return nil_c(n.bs, std::move(arg));
        }
        case 1: {
            const auto& n = std::get<LeafNode>(value);
            return leaf_c(n.bs, n.elt, std::move(arg));
        }
        case 2: {
            const auto& n = std::get<BinNode>(value);
            return bin_c(n.bs, n.left, n.right, std::move(arg));
        }
        case 3: {
            const auto& n = std::get<RootNode>(value);
            return root_c(n.meta, n.trie, std::move(arg));
        }
        default: {
            const auto& n = std::get<NameNode>(value);
            return name_c(n.name, n.trie, std::move(arg));
        }
    }
}

template<typename X>
template<typename NilC, typename LeafC, typename BinC, typename RootC, typename NameC>
auto Trie<X>::elim_ref(const Trie& trie, NilC&& nil_c, LeafC&& leaf_c, BinC&& bin_c,
                       RootC&& root_c, NameC&& name_c)
    -> std::invoke_result_t<NilC&, const BitString&> {
    const auto& value = trie.forced().node_->value;
    if (const auto* n = std::get_if<NilNode>(&value)) return nil_c(n->bs);
    if (const auto* n = std::get_if<LeafNode>(&value)) return leaf_c(n->bs, n->elt);
    if (const auto* n = std::get_if<BinNode>(&value)) return bin_c(n->bs, n->left, n->right);
    if (const auto* n = std::get_if<RootNode>(&value)) return root_c(n->meta, n->trie);
    const auto& n = std::get<NameNode>(value);
    return name_c(n.name, n.trie);
}

template<typename X>
template<typename Pred>
std::optional<X> Trie<X>::find_by(const Trie& trie, HashValue hash_index, Pred&& pred) {
    const Trie* current = &trie;
    for (;;) {
        const auto& value = current->forced().node_->value;
        if (const auto* lf = std::get_if<LeafNode>(&value)) {
            if (pred(lf->elt)) {
                return lf->elt;
            }
            return std::nullopt;
        }
        if (const auto* br = std::get_if<BinNode>(&value)) {
            current = (hash_index & 1) == 0 ? &br->left : &br->right;
            hash_index >>= 1;
        } else if (const auto* top = std::get_if<RootNode>(&value)) {
            current = &top->trie;
        } else if (const auto* named = std::get_if<NameNode>(&value)) {
            current = &named->trie;
        } else {
            return std::nullopt;
        }
    }
}

template<typename X>
std::optional<X> Trie<X>::find(const Trie& trie, const X& elt, HashValue hash_index) {
    return find_by(trie, hash_index, [&elt](const X& x) { return x == elt; });
}

template<typename X>
bool Trie<X>::is_empty(const Trie& trie) {
    return elim_ref(trie,
                    [](const BitString&) { return true; },
                    [](const BitString&, const X&) { return false; },
                    [](const BitString&, const Trie&, const Trie&) { return false; },
                    [](const Meta&, const Trie& t) { return is_empty(t); },
                    [](const Name&, const Trie& t) { return is_empty(t); });
}

template<typename X>
Trie<X> Trie<X>::split_atomic(const Trie& trie) {
    const auto& value = trie.node_->value;
    if (std::holds_alternative<NilNode>(value) || std::holds_alternative<BinNode>(value)) {
        return trie;
    }
    const auto* lf = std::get_if<LeafNode>(&value);
    if (!lf) {
        throw MalformedTrieError(std::string("split_atomic expects Nil, Leaf or Bin, found ") +
                                 node_kind_name(trie.kind()));
    }

    BitString bs0 = BitString::prepend(0, lf->bs);
    BitString bs1 = BitString::prepend(1, lf->bs);
    HashValue hash = TrieKey<X>::hash(lf->elt);
    if (bs1.is_suffix_of(hash)) {
        return bin(lf->bs, nil(bs0), leaf(bs1, lf->elt));
    }
    return bin(lf->bs, leaf(bs0, lf->elt), nil(bs1));
}

// =============================================================================
// Inspection
// =============================================================================

template<typename X>
NodeKind Trie<X>::kind() const {
    return static_cast<NodeKind>(node_->value.index());
}

template<typename X>
const Trie<X>& Trie<X>::unwrapped() const {
    const Trie* current = this;
    for (;;) {
        const auto& value = current->node_->value;
        if (const auto* articulated = std::get_if<ArtNode>(&value)) {
            current = &articulated->art.force();
        } else if (const auto* named = std::get_if<NameNode>(&value)) {
            current = &named->trie;
        } else {
            return *current;
        }
    }
}

template<typename X>
bool Trie<X>::equal_nodes(const Trie& a, const Trie& b) {
    const Trie& x = a.unwrapped();
    const Trie& y = b.unwrapped();
    if (x.node_ == y.node_) {
        return true;
    }

    const auto& xv = x.node_->value;
    const auto& yv = y.node_->value;
    if (xv.index() != yv.index()) {
        return false;
    }

    if (const auto* n = std::get_if<NilNode>(&xv)) {
        return n->bs == std::get<NilNode>(yv).bs;
    }
    if (const auto* n = std::get_if<LeafNode>(&xv)) {
        const auto& m = std::get<LeafNode>(yv);
        return n->bs == m.bs && n->elt == m.elt;
    }
    if (const auto* n = std::get_if<BinNode>(&xv)) {
        const auto& m = std::get<BinNode>(yv);
        return n->bs == m.bs && equal_nodes(n->left, m.left) && equal_nodes(n->right, m.right);
    }
    const auto& n = std::get<RootNode>(xv);
    const auto& m = std::get<RootNode>(yv);
    return n.meta == m.meta && equal_nodes(n.trie, m.trie);
}

template<typename X>
bool Trie<X>::operator==(const Trie& other) const {
    return equal_nodes(*this, other);
}

template<typename X>
uint64_t Trie<X>::structural_hash() const {
    const Trie& t = unwrapped();
    const auto& value = t.node_->value;
    uint64_t h = fnv_hash(FNV_OFFSET, value.index());

    if (const auto* n = std::get_if<NilNode>(&value)) {
        return fnv_hash(h, std::hash<BitString>{}(n->bs));
    }
    if (const auto* n = std::get_if<LeafNode>(&value)) {
        h = fnv_hash(h, Hasher<X>{}(n->elt));
        return fnv_hash(h, std::hash<BitString>{}(n->bs));
    }
    if (const auto* n = std::get_if<BinNode>(&value)) {
        h = fnv_hash(h, n->right.structural_hash());
        h = fnv_hash(h, n->left.structural_hash());
        return fnv_hash(h, std::hash<BitString>{}(n->bs));
    }
    const auto& n = std::get<RootNode>(value);
    h = fnv_hash(h, n.trie.structural_hash());
    return fnv_hash(h, std::hash<Meta>{}(n.meta));
}

} // namespace inctrie

namespace std {
    template<typename X>
    struct hash<inctrie::Trie<X>> {
        std::size_t operator()(const inctrie::Trie<X>& trie) const {
            return static_cast<std::size_t>(trie.structural_hash());
        }
    };
}

#endif // INCTRIE_TRIE_HPP
