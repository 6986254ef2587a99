#include "biopat/pattern.hpp"
#include "biopat/logging.hpp"

#include <algorithm>

namespace biopat {

namespace {

template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

std::string toString(PatternKind kind) {
    switch (kind) {
        case PatternKind::Empty: return "Empty";
        case PatternKind::Any: return "Any";
        case PatternKind::Gap: return "Gap";
        case PatternKind::Motif: return "Motif";
        case PatternKind::Regex: return "Regex";
        case PatternKind::Prosite: return "Prosite";
        case PatternKind::Repeat: return "Repeat";
        case PatternKind::Series: return "Series";
        case PatternKind::Set: return "Set";
    }
    return "Unknown";
}

// ============================================================================
// Set
// ============================================================================

Set::Set(std::vector<Pattern> patterns, double threshold)
    : patterns_(std::move(patterns)), threshold_(threshold) {
    if (patterns_.empty()) {
        throw PatternError("Set cannot be empty");
    }
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw PatternError("Set threshold must lie in [0, 1]");
    }

    const bool has_motif = std::ranges::any_of(patterns_, [](const Pattern& p) {
        return p.is<Motif>();
    });
    if (threshold_ != kDefaultThreshold && !has_motif) {
        logging::WarningLogger log{};
        stream(log) << "Set threshold " << threshold_ << " has no effect: the set holds no Motif";
    }
}

Set::Set(const Set& other) = default;
Set::Set(Set&& other) noexcept = default;
Set& Set::operator=(const Set& other) = default;
Set& Set::operator=(Set&& other) noexcept = default;
Set::~Set() = default;

bool Set::match(std::string_view symbols) const {
    return std::ranges::any_of(patterns_, [&](const Pattern& pattern) {
        if (const auto* motif = pattern.getIf<Motif>()) {
            return motif->match(symbols, threshold_);
        }
        return pattern.match(symbols);
    });
}

// ============================================================================
// Pattern
// ============================================================================

PatternKind Pattern::kind() const noexcept {
    if (value_.valueless_by_exception()) return PatternKind::Empty;
    return static_cast<PatternKind>(value_.index());
}

bool Pattern::isMatchable() const noexcept {
    switch (kind()) {
        case PatternKind::Empty:
        case PatternKind::Any:
        case PatternKind::Gap:
            return false;
        default:
            return true;
    }
}

bool Pattern::match(std::string_view symbols) const {
    if (value_.valueless_by_exception()) {
        throw InvalidPatternError();
    }

    return std::visit(overloaded{
        [](const std::monostate&) -> bool { throw InvalidPatternError(); },
        [](const Any&) -> bool { throw InvalidPatternError("Supplied pattern is invalid: Any is not matchable"); },
        [](const Gap&) -> bool { throw InvalidPatternError("Supplied pattern is invalid: Gap is not matchable"); },
        [&](const auto& pattern) -> bool { return pattern.match(symbols); },
    }, value_);
}

} // namespace biopat
