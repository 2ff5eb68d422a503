// File: src/ir/transform/ScopeMarkers.hpp
// Purpose: Classify scope marker nodes and outlined scope bodies.
// Key invariants: Pure queries; never mutate the graph.
// Ownership/Lifetime: Borrow nodes and graphs for the duration of the call.
#pragma once

#include "ir/core/Graph.hpp"

namespace strata::transform
{

/// \brief True when @p n opens a scope.
bool isScopeEnter(const core::Node &n);

/// \brief True when @p n closes a scope.
bool isScopeExit(const core::Node &n);

/// \brief True for either scope marker kind.
bool isScopeMarker(const core::Node &n);

/// \brief True when @p g holds at least one scope marker at its top level.
bool hasScopeMarkers(const core::Graph &g);

/// \brief Find the value a scope exit passes through.
/// \details Scans @p g backwards from @p exitNode to its scope.enter and
///          returns the last node in between that is neither a parameter
///          nor a scope marker. Nested scopes are looked through.
/// \return The carried node, or nullptr for an empty scope or a node that
///         is not a well-formed scope exit of @p g.
const core::Node *scopeResultNode(const core::Graph &g, const core::Node &exitNode);

/// \brief Test whether @p invoke calls a child of @p parent that begins with a scope.
/// \details The callee is resolved among @p parent's child graphs. The body
///          qualifies when its first non-parameter node is a scope enter.
///          A non-invoke node or an unknown callee yields false.
bool isOutlinedScopeBody(const core::Graph &parent, const core::Node &invoke);

} // namespace strata::transform
