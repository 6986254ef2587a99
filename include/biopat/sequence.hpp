#pragma once

#include "biopat/alphabet.hpp"

#include <string>
#include <string_view>
#include <optional>
#include <stdexcept>
#include <iosfwd>

namespace biopat {

/**
 * @brief Exception class for sequence-related errors
 */
class SequenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief An immutable run of symbols tagged with the alphabet it was validated against
 *
 * Symbols are normalised to upper case on construction. Wildcards ('N', 'X')
 * are accepted in every alphabet.
 */
class Sequence {
public:
    explicit Sequence(std::string_view symbols, Alphabet alphabet = Alphabet::DNA);
    Sequence(std::string_view symbols, Alphabet alphabet, std::string id);

    Sequence(const Sequence&) = default;
    Sequence(Sequence&&) noexcept = default;
    Sequence& operator=(const Sequence&) = default;
    Sequence& operator=(Sequence&&) noexcept = default;
    ~Sequence() = default;

    // Getters
    [[nodiscard]] const std::string& symbols() const noexcept { return symbols_; }
    [[nodiscard]] Alphabet alphabet() const noexcept { return alphabet_; }
    [[nodiscard]] size_t length() const noexcept { return symbols_.length(); }
    [[nodiscard]] const std::optional<std::string>& id() const noexcept { return id_; }
    [[nodiscard]] bool empty() const noexcept { return symbols_.empty(); }

    // Iterator support for ranges
    [[nodiscard]] auto begin() const noexcept { return symbols_.begin(); }
    [[nodiscard]] auto end() const noexcept { return symbols_.end(); }
    [[nodiscard]] auto cbegin() const noexcept { return symbols_.cbegin(); }
    [[nodiscard]] auto cend() const noexcept { return symbols_.cend(); }

    // Element access
    [[nodiscard]] char operator[](size_t index) const { return symbols_[index]; }
    [[nodiscard]] char at(size_t index) const { return symbols_.at(index); }

    [[nodiscard]] bool hasWildcards() const noexcept;

    /**
     * @brief Extract a sub-sequence
     * @param start Zero-based start position (must be < length())
     * @param length Requested length, clamped to the end of the sequence
     * @throws SequenceError if start is out of range
     */
    [[nodiscard]] Sequence subsequence(size_t start, size_t length) const;

    /**
     * @brief Extract the suffix beginning at start
     * @throws SequenceError if start is out of range
     */
    [[nodiscard]] Sequence suffix(size_t start) const;

    [[nodiscard]] bool operator==(const Sequence& other) const = default;

    // Stringified view of the symbols
    [[nodiscard]] std::string toString() const { return symbols_; }

private:
    std::string symbols_;
    Alphabet alphabet_;
    std::optional<std::string> id_;

    struct Unchecked {};
    Sequence(Unchecked, std::string symbols, Alphabet alphabet);

    static void validateSymbols(std::string_view symbols, Alphabet alphabet);
};

// Stream output
std::ostream& operator<<(std::ostream& os, const Sequence& seq);

} // namespace biopat
