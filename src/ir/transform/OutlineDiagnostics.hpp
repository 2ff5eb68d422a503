// File: src/ir/transform/OutlineDiagnostics.hpp
// Purpose: Stable diagnostic codes reported by the scope outlining pass.
// Key invariants: Codes never change meaning once published.
// Ownership/Lifetime: Compile-time constants only.
#pragma once

namespace strata::transform::diag
{

/// Exit without an open enter, or exit of a non-innermost enter.
inline constexpr const char *kMalformedScopeNesting = "S1001";
/// Outlined scope body holding fewer than two markers.
inline constexpr const char *kIncompleteScopeBlock = "S1002";
/// Body output that is neither absent, a single node, nor a list of nodes.
inline constexpr const char *kUnsupportedOutputShape = "S1003";
/// Output signature disagreeing with the graph's output node.
inline constexpr const char *kOutputSpecificationMismatch = "S1004";
/// Scope parameter computed inside the outlined body.
inline constexpr const char *kUnsupportedScopeParameter = "S1005";

} // namespace strata::transform::diag
