#include "biopat/regex.hpp"
#include "biopat/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

#include <re2/re2.h>

namespace biopat {

namespace {

std::string toLower(std::string_view text) {
    std::string result;
    result.reserve(text.length());
    std::ranges::transform(text, std::back_inserter(result), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return result;
}

} // namespace

Regex::Regex(std::string_view expression) : expression_(toLower(expression)) {
    RE2::Options options;
    options.set_log_errors(false);

    auto compiled = std::make_shared<const RE2>(expression_, options);
    if (!compiled->ok()) {
        logging::WarningLogger log{};
        stream(log) << "Rejected regular expression '" << expression_ << "': " << compiled->error();
        throw PatternError("Invalid regular expression '" + expression_ + "': " + compiled->error());
    }
    compiled_ = std::move(compiled);
}

bool Regex::match(std::string_view symbols) const {
    const auto input = toLower(symbols);
    return RE2::PartialMatch(input, *compiled_);
}

} // namespace biopat
