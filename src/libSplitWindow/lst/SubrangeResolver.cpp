#include "SubrangeResolver.hpp"
#include "core/Log.hpp"

SW_DISABLE_WARNINGS_PUSH
#include <fmt/format.h>
SW_DISABLE_WARNINGS_POP

namespace splitwindow {

namespace {

String JoinKeys(const Vector<const CoefficientSubrange*>& candidates) {
    String keys;
    for (const auto* subrange : candidates) {
        if (!keys.empty()) keys += ", ";
        keys += subrange->key;
    }
    return keys;
}

} // namespace

Optional<SubrangeTieBreak> ParseTieBreak(StringView name) {
    if (name == "random") return SubrangeTieBreak::Random;
    if (name == "reject_ambiguous") return SubrangeTieBreak::RejectAmbiguous;
    return std::nullopt;
}

const char* TieBreakToString(SubrangeTieBreak policy) {
    switch (policy) {
        case SubrangeTieBreak::Random:          return "random";
        case SubrangeTieBreak::RejectAmbiguous: return "reject_ambiguous";
    }
    return "unknown";
}

Vector<const CoefficientSubrange*> FindCandidateSubranges(f64 cwv, const CoefficientTable& table) {
    Vector<const CoefficientSubrange*> candidates;
    for (const auto& subrange : table.subranges) {
        if (subrange.Contains(cwv)) {
            candidates.push_back(&subrange);
        }
    }
    return candidates;
}

CoefficientSubrange ResolveSubrange(f64 cwv,
                                    const CoefficientTable& table,
                                    SubrangeTieBreak policy,
                                    std::mt19937& rng) {
    auto candidates = FindCandidateSubranges(cwv, table);

    if (candidates.empty()) {
        throw SplitWindowError(ErrorCode::NoMatchingSubrange,
            fmt::format("column water vapour {} lies outside every subrange of the coefficient table", cwv));
    }

    if (candidates.size() == 1) {
        SW_LOG_DEBUG("CWV {} resolved to subrange {}", cwv, candidates.front()->key);
        return *candidates.front();
    }

    if (policy == SubrangeTieBreak::RejectAmbiguous) {
        throw SplitWindowError(ErrorCode::AmbiguousSubrange,
            fmt::format("column water vapour {} matches subranges {}", cwv, JoinKeys(candidates)));
    }

    std::uniform_int_distribution<usize> pick(0, candidates.size() - 1);
    const CoefficientSubrange* chosen = candidates[pick(rng)];

    SW_LOG_WARN("CWV {} matches {} subranges ({}), picked {} at random",
                cwv, candidates.size(), JoinKeys(candidates), chosen->key);
    return *chosen;
}

} // namespace splitwindow
