#ifndef INCTRIE_BITSTRING_HPP
#define INCTRIE_BITSTRING_HPP

#include <inctrie/types.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace inctrie {

/**
 * Fixed-capacity bit-vector used as a trie address.
 *
 * Bit i of value is the branch taken at depth i, so the path of a node at
 * depth d equals the low d bits of the placement hash of every element below
 * it. Invariant: length <= MAX_LEN.
 */
struct BitString {
    std::size_t length;
    uint64_t value;

    constexpr BitString() : length(0), value(0) {}
    constexpr BitString(std::size_t len, uint64_t val) : length(len), value(val) {}

    // The zero-length path of a root subtree
    static constexpr BitString empty() { return BitString(); }

    /**
     * New bit-string one bit longer, with bit placed at position length.
     * @throws BitStringOverflowError if the string is already MAX_LEN long
     */
    static BitString prepend(unsigned bit, const BitString& bs);

    static std::size_t length_of(const BitString& bs) { return bs.length; }

    bool is_full() const { return length >= MAX_LEN; }

    bool bit(std::size_t index) const { return index < length && ((value >> index) & 1) != 0; }

    // True if every set bit of the path is also set in hash
    bool is_suffix_of(HashValue hash) const { return (value & hash) == value; }

    // Bits lowest first, e.g. "011" for length 3, value 0b110
    std::string to_string() const;

    bool operator==(const BitString& other) const {
        return length == other.length && value == other.value;
    }
    bool operator!=(const BitString& other) const { return !(*this == other); }
};

} // namespace inctrie

namespace std {
    template<>
    struct hash<inctrie::BitString> {
        std::size_t operator()(const inctrie::BitString& bs) const {
            return static_cast<std::size_t>(
                inctrie::fnv_hash(inctrie::fnv_hash(inctrie::FNV_OFFSET, bs.length), bs.value));
        }
    };
}

#endif // INCTRIE_BITSTRING_HPP
