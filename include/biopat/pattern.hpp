#pragma once

#include "biopat/errors.hpp"
#include "biopat/motif.hpp"
#include "biopat/prosite.hpp"
#include "biopat/regex.hpp"
#include "biopat/region.hpp"
#include "biopat/sequence.hpp"
#include "biopat/series.hpp"

#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace biopat {

class Pattern;

/**
 * @brief The case held by a Pattern, in variant order
 */
enum class PatternKind {
    Empty,
    Any,
    Gap,
    Motif,
    Regex,
    Prosite,
    Repeat,
    Series,
    Set
};

[[nodiscard]] std::string toString(PatternKind kind);

/**
 * @brief First-match-wins alternation over arbitrary patterns
 *
 * The set's threshold replaces the threshold of every Motif it directly
 * contains for the duration of a match; other pattern kinds are matched
 * unchanged. Patterns are tried in declaration order.
 */
class Set {
public:
    static constexpr double kDefaultThreshold = 1.0;

    /**
     * @throws PatternError if patterns is empty or the threshold lies outside [0, 1]
     */
    explicit Set(std::vector<Pattern> patterns, double threshold = kDefaultThreshold);

    Set(const Set& other);
    Set(Set&& other) noexcept;
    Set& operator=(const Set& other);
    Set& operator=(Set&& other) noexcept;
    ~Set();

    [[nodiscard]] bool match(std::string_view symbols) const;

    [[nodiscard]] bool match(const Sequence& seq) const {
        return match(std::string_view{seq.symbols()});
    }

    [[nodiscard]] const std::vector<Pattern>& patterns() const noexcept { return patterns_; }
    [[nodiscard]] double threshold() const noexcept { return threshold_; }

private:
    std::vector<Pattern> patterns_;
    double threshold_;
};

/**
 * @brief A closed sum type over every pattern kind
 *
 * A default-constructed Pattern is empty. Empty, Gap and Any values are not
 * matchable: match() on them throws InvalidPatternError.
 */
class Pattern {
public:
    using Value = std::variant<std::monostate, Any, Gap, Motif, Regex, Prosite, Repeat, Series, Set>;

    Pattern() = default;

    template <typename T>
        requires (!std::same_as<std::remove_cvref_t<T>, Pattern>) &&
                 std::constructible_from<Value, T&&>
    Pattern(T&& value) : value_(std::forward<T>(value)) {}

    [[nodiscard]] PatternKind kind() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return kind() == PatternKind::Empty; }
    [[nodiscard]] bool isMatchable() const noexcept;

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(value_); }

    template <typename T>
    [[nodiscard]] const T& get() const { return std::get<T>(value_); }

    template <typename T>
    [[nodiscard]] const T* getIf() const noexcept { return std::get_if<T>(&value_); }

    [[nodiscard]] std::string kindName() const { return toString(kind()); }

    /**
     * @brief Match the held pattern against the input
     * @throws InvalidPatternError if the pattern is empty, a Gap or an Any
     */
    [[nodiscard]] bool match(std::string_view symbols) const;

    [[nodiscard]] bool match(const Sequence& seq) const {
        return match(std::string_view{seq.symbols()});
    }

private:
    Value value_;
};

} // namespace biopat
