#pragma once

#include "core/CoefficientTable.hpp"

#include <random>

namespace splitwindow {

// ============================================================================
// Subrange resolution - pick the coefficient subrange for a CWV estimate
// ============================================================================
// Candidates are the subranges whose open interval strictly contains the CWV
// value. With zero candidates resolution fails (NoMatchingSubrange). With
// several candidates the tie-break policy decides:
//
//   Random          - uniform choice among the candidates (historic behaviour;
//                     the published table overlaps, e.g. Range_1 / Range_6)
//   RejectAmbiguous - fail with AmbiguousSubrange
// ============================================================================

enum class SubrangeTieBreak {
    Random,
    RejectAmbiguous
};

// "random" / "reject_ambiguous"
SW_API Optional<SubrangeTieBreak> ParseTieBreak(StringView name);
SW_API const char* TieBreakToString(SubrangeTieBreak policy);

// Every subrange containing cwv, in table order
SW_API Vector<const CoefficientSubrange*> FindCandidateSubranges(f64 cwv, const CoefficientTable& table);

// Throws SplitWindowError (NoMatchingSubrange, AmbiguousSubrange)
SW_API CoefficientSubrange ResolveSubrange(f64 cwv,
                                           const CoefficientTable& table,
                                           SubrangeTieBreak policy,
                                           std::mt19937& rng);

} // namespace splitwindow
