//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares ScopeBoundaryTracker, the stateful segment-boundary predicate used
// to drive sequentialSplit when outlining scopes. Fed the nodes of one graph in
// program order, it reports where a new segment has to start so that every
// maximal top-level scope.enter .. scope.exit span lands in a segment of its
// own. Nested scopes only deepen the stack and never cut a segment.
//
// Example (one segment per bracket):
//   [%a = call f]  [%b = scope.enter  %c = call g  %d = scope.exit(%b)]  [%e = call h]
//
// A tracker instance is single-use: create a fresh one per graph.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Node.hpp"
#include "support/diag_expected.hpp"

#include <vector>

namespace strata::transform
{

class ScopeBoundaryTracker
{
  public:
    /// @brief Report whether a new segment starts at @p n.
    /// @return true/false, or S1001 when @p n closes a scope that is not the
    ///         innermost open one.
    support::Expected<bool> startsNewSegment(const core::Node &n);

    /// @brief Number of currently open scopes.
    [[nodiscard]] size_t depth() const
    {
        return openEnters_.size();
    }

  private:
    std::vector<core::NodeId> openEnters_;
    bool forceNewSegment_ = false;
};

} // namespace strata::transform
