#ifndef INCTRIE_NAME_HPP
#define INCTRIE_NAME_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace inctrie {

/**
 * Stable identity used to correlate a computation across edits.
 *
 * Names are immutable trees of constructors (unit, string, number, pair,
 * fork-left, fork-right) behind a shared handle, with the hash computed once
 * at construction. Equality is structural.
 *
 * fork() is the correctness-critical operation: it is a pure function of the
 * parent, and its two children are distinct from each other, from the parent
 * and from any name built without forking that parent.
 */
class Name {
public:
    enum class Kind : uint8_t {
        UNIT,
        STRING,
        NUMBER,
        PAIR,
        FORK_LEFT,
        FORK_RIGHT
    };

    // Same as Name::unit()
    Name();

    static Name unit();
    static Name of_str(const std::string& s);
    static Name of_usize(std::size_t n);
    static Name pair(const Name& a, const Name& b);

    std::pair<Name, Name> fork() const;

    Kind kind() const;
    uint64_t hash() const;
    std::string to_string() const;

    bool operator==(const Name& other) const;
    bool operator!=(const Name& other) const { return !(*this == other); }

    // Opaque, defined in name.cpp
    struct Rep;

private:
    explicit Name(std::shared_ptr<const Rep> rep);

    std::shared_ptr<const Rep> rep_;
};

} // namespace inctrie

namespace std {
    template<>
    struct hash<inctrie::Name> {
        std::size_t operator()(const inctrie::Name& name) const {
            return static_cast<std::size_t>(name.hash());
        }
    };
}

#endif // INCTRIE_NAME_HPP
