#include "biopat/prosite.hpp"
#include "biopat/logging.hpp"

#include <optional>
#include <vector>

#include <re2/re2.h>

namespace biopat {

namespace {

std::vector<std::string_view> splitTokens(std::string_view pattern) {
    std::vector<std::string_view> tokens;
    size_t start = 0;
    while (true) {
        const auto pos = pattern.find('-', start);
        if (pos == std::string_view::npos) {
            tokens.push_back(pattern.substr(start));
            break;
        }
        tokens.push_back(pattern.substr(start, pos - start));
        start = pos + 1;
    }
    return tokens;
}

std::optional<std::string> parseExclusion(std::string_view token, Alphabet alphabet) {
    static const RE2 exclusion(R"(\{([a-zA-Z*]+)\})");
    std::string inner;
    if (!RE2::FullMatch(token, exclusion, &inner)) return std::nullopt;
    if (!checkAlphabet(alphabet, inner)) return std::nullopt;
    return "[^" + inner + "]";
}

std::optional<std::string> parseClass(std::string_view token) {
    static const RE2 character_class(R"(\[[^\[\]]+\])");
    if (!RE2::FullMatch(token, character_class)) return std::nullopt;
    return std::string(token);
}

// The bound applies to the last symbol of the prefix, as in the emitted regex
std::optional<std::string> parseRepeat(std::string_view token, Alphabet alphabet) {
    static const RE2 repeat(R"(([a-zA-Z]+)\(([0-9]{1,6})(?:,([0-9]{1,6}))?\))");
    std::string prefix;
    std::string lower;
    std::string upper;
    if (!RE2::FullMatch(token, repeat, &prefix, &lower, &upper)) return std::nullopt;
    if (!checkAlphabet(alphabet, prefix)) return std::nullopt;
    if (!upper.empty() && std::stoul(lower) > std::stoul(upper)) return std::nullopt;

    std::string fragment;
    for (char symbol : prefix) {
        fragment += isWildcard(symbol) ? '.' : symbol;
    }
    fragment += "{" + lower;
    if (!upper.empty()) fragment += "," + upper;
    fragment += "}";
    return fragment;
}

std::optional<std::string> parseGeneral(std::string_view token, Alphabet alphabet) {
    if (!checkAlphabet(alphabet, token)) return std::nullopt;
    return std::string(token);
}

std::optional<std::string> parseToken(std::string_view token, Alphabet alphabet) {
    if (token.empty()) return std::nullopt;
    if (token.find('[') != std::string_view::npos) return parseClass(token);
    if (token.find('{') != std::string_view::npos) return parseExclusion(token, alphabet);
    if (token.find('(') != std::string_view::npos) return parseRepeat(token, alphabet);
    if (token.length() == 1 && isWildcard(token.front())) return std::string(".");
    return parseGeneral(token, alphabet);
}

} // namespace

std::string Prosite::compile(std::string_view pattern, Alphabet alphabet) {
    std::string expression;
    for (const auto token : splitTokens(pattern)) {
        auto fragment = parseToken(token, alphabet);
        if (!fragment) {
            throw PatternError("Invalid Prosite pattern '" + std::string(pattern) +
                               "': bad token '" + std::string(token) + "'");
        }
        expression += *fragment;
    }
    return expression;
}

Prosite::Prosite(std::string_view pattern, Alphabet alphabet)
    : pattern_(pattern), regex_(compile(pattern, alphabet)) {
    logging::DebugLogger log{};
    stream(log) << "Compiled Prosite pattern '" << pattern_ << "' to '" << regex_.expression() << "'";
}

} // namespace biopat
