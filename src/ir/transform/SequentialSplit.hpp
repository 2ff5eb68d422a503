// File: src/ir/transform/SequentialSplit.hpp
// Purpose: Partition a graph into contiguous segments outlined as child graphs.
// Key invariants: Segments preserve program order; parameters and the output
//                 node stay in the top-level graph.
// Ownership/Lifetime: Returns a new graph; the input is not modified.
#pragma once

#include "ir/core/Graph.hpp"
#include "support/diag_expected.hpp"

#include <functional>

namespace strata::transform
{

/// \brief Decides whether a node opens a new segment.
/// \details Invoked exactly once per node of the input graph, in program
///          order, including parameters and the output node.
using SegmentBoundaryFn = std::function<bool(const core::Node &)>;

/// \brief Split @p g into segments and outline each one as a child graph.
/// \details Every node for which @p startsNewSegment returns true begins a new
///          segment. Each non-empty segment becomes a child graph named
///          `submod_<n>` whose parameters are the values it reads from outside
///          (in first-use order) and whose outputs are the values read after
///          it. The returned graph calls the segments in order with `invoke`
///          nodes; segments with several outputs are unpacked with `getitem`.
/// \return The rewritten graph or a diagnostic when @p g references an
///         undefined value.
support::Expected<core::Graph> sequentialSplit(const core::Graph &g, const SegmentBoundaryFn &startsNewSegment);

} // namespace strata::transform
