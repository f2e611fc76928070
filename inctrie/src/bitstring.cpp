#include <inctrie/bitstring.hpp>
#include <inctrie/errors.hpp>

namespace inctrie {

BitString BitString::prepend(unsigned bit, const BitString& bs) {
    if (bs.is_full()) {
        throw BitStringOverflowError("cannot extend a path of length " + std::to_string(bs.length));
    }
    uint64_t value = bs.value;
    if (bit & 1u) {
        value |= (uint64_t{1} << bs.length);
    }
    return BitString(bs.length + 1, value);
}

std::string BitString::to_string() const {
    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(((value >> i) & 1) ? '1' : '0');
    }
    return result;
}

} // namespace inctrie
