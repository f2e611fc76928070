#ifndef INCTRIE_ERRORS_HPP
#define INCTRIE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace inctrie {

// Base of every error raised by the library. None of these are caught or
// retried inside inctrie: they signal misuse or a broken hash assumption.
class TrieException : public std::runtime_error {
public:
    explicit TrieException(const std::string& message)
        : std::runtime_error(message) {}
};

// Wrong node shape: extend without the Name(Art(Root ...)) wrapper,
// a Root met below the top, split_atomic on a wrapper node
class MalformedTrieError : public TrieException {
public:
    explicit MalformedTrieError(const std::string& message)
        : TrieException("Malformed trie: " + message) {}
};

// Two distinct keys still share every hash bit at MAX_LEN
class HashExhaustedError : public TrieException {
public:
    HashExhaustedError(const std::string& message, std::size_t depth)
        : TrieException("Hash space exhausted: " + message), depth_(depth) {}

    std::size_t depth() const noexcept { return depth_; }

private:
    std::size_t depth_;
};

class BitStringOverflowError : public TrieException {
public:
    explicit BitStringOverflowError(const std::string& message)
        : TrieException("Bit-string overflow: " + message) {}
};

class UnsupportedOperationError : public TrieException {
public:
    explicit UnsupportedOperationError(const std::string& operation)
        : TrieException("Unsupported operation: " + operation) {}
};

// Re-entrant forcing or memoization of a computation already in progress
class EngineError : public TrieException {
public:
    explicit EngineError(const std::string& message)
        : TrieException("Engine error: " + message) {}
};

} // namespace inctrie

#endif // INCTRIE_ERRORS_HPP
