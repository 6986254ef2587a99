#pragma once

#include "biopat/errors.hpp"
#include "biopat/sequence.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace re2 {
class RE2;
}

namespace biopat {

/**
 * @brief A pattern that searches its input with a regular expression
 *
 * Both the expression and the input are lower-cased, and the expression may
 * match anywhere in the input. The expression is compiled once with RE2; the
 * compiled program is immutable and shared between copies.
 */
class Regex {
public:
    /**
     * @throws PatternError if RE2 rejects the expression
     */
    explicit Regex(std::string_view expression);

    [[nodiscard]] bool match(std::string_view symbols) const;

    [[nodiscard]] bool match(const Sequence& seq) const {
        return match(std::string_view{seq.symbols()});
    }

    [[nodiscard]] const std::string& expression() const noexcept { return expression_; }

private:
    std::string expression_;
    std::shared_ptr<const re2::RE2> compiled_;
};

} // namespace biopat
