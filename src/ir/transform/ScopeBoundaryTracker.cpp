//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "ir/transform/ScopeBoundaryTracker.hpp"

#include "ir/transform/OutlineDiagnostics.hpp"
#include "ir/transform/ScopeMarkers.hpp"

using namespace strata::core;

namespace strata::transform
{

support::Expected<bool> ScopeBoundaryTracker::startsNewSegment(const Node &n)
{
    if (isScopeExit(n) && openEnters_.empty())
        return support::makeError(
            diag::kMalformedScopeNesting, {}, "scope.exit '%" + n.name + "' has no open scope.enter");

    if (forceNewSegment_ || (openEnters_.empty() && isScopeEnter(n)))
    {
        forceNewSegment_ = false;
        if (isScopeEnter(n))
            openEnters_.push_back(n.id);
        return true;
    }

    if (isScopeEnter(n))
    {
        openEnters_.push_back(n.id);
        return false;
    }

    if (isScopeExit(n))
    {
        const bool closesInnermost = n.operands.size() == 1 && n.operands.front().isRef() &&
                                     n.operands.front().id == openEnters_.back();
        if (!closesInnermost)
            return support::makeError(diag::kMalformedScopeNesting,
                                      {},
                                      "scope.exit '%" + n.name + "' does not close the innermost open scope");
        openEnters_.pop_back();
        if (openEnters_.empty())
            forceNewSegment_ = true;
    }
    return false;
}

} // namespace strata::transform
