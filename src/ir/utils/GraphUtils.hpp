//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ir/utils/GraphUtils.hpp
// Purpose: Node filtering, use replacement and child graph inlining helpers.
// Key invariants: Helpers leave the graph structurally valid on success.
// Ownership/Lifetime: Operate on caller-owned graphs; never retain pointers.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Graph.hpp"
#include "support/diag_expected.hpp"

#include <functional>
#include <vector>

namespace strata::utils
{

using NodePredicate = std::function<bool(const core::Node &)>;

/// @brief Collect ids of the nodes of @p g satisfying @p pred, in program order.
std::vector<core::NodeId> filterNodes(const core::Graph &g, const NodePredicate &pred);

/// @brief Return the first node of @p g satisfying @p pred, or nullptr.
const core::Node *firstNode(const core::Graph &g, const NodePredicate &pred);

/// @brief Redirect every use of @p oldId to @p replacement and erase the node.
support::Expected<void> replaceNode(core::Graph &g, core::NodeId oldId, const core::Value &replacement);

/// @brief Splice the child graph called by invoke node @p invokeId into @p parent.
///
/// Copies of the child's non-parameter nodes are inserted before the call with
/// parameters bound to the call arguments. A single-valued call is replaced by
/// the copied result; a multi-valued call must only be consumed by getitem
/// nodes, each of which is replaced by the matching copied element. The invoke
/// node is erased; the child graph itself is left in place.
support::Expected<void> inlineInvoke(core::Graph &parent, core::NodeId invokeId);

} // namespace strata::utils
