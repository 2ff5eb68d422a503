//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "ir/transform/ScopeMarkers.hpp"

#include <algorithm>

using namespace strata::core;

namespace strata::transform
{

bool isScopeEnter(const Node &n)
{
    return n.op == Opcode::ScopeEnter;
}

bool isScopeExit(const Node &n)
{
    return n.op == Opcode::ScopeExit;
}

bool isScopeMarker(const Node &n)
{
    return isScopeEnter(n) || isScopeExit(n);
}

bool hasScopeMarkers(const Graph &g)
{
    return std::any_of(g.nodes().begin(), g.nodes().end(), [](const Node &n) { return isScopeMarker(n); });
}

const Node *scopeResultNode(const Graph &g, const Node &exitNode)
{
    if (!isScopeExit(exitNode) || exitNode.operands.size() != 1 || !exitNode.operands.front().isRef())
        return nullptr;
    const NodeId enterId = exitNode.operands.front().id;
    for (long i = g.indexOf(exitNode.id) - 1; i >= 0; --i)
    {
        const Node &n = g.nodes()[static_cast<size_t>(i)];
        if (n.id == enterId)
            return nullptr;
        if (n.op == Opcode::Param || isScopeMarker(n) || !producesValue(n.op))
            continue;
        return &n;
    }
    return nullptr;
}

bool isOutlinedScopeBody(const Graph &parent, const Node &invoke)
{
    if (invoke.op != Opcode::Invoke)
        return false;
    const Graph *body = parent.subgraph(invoke.target);
    if (!body)
        return false;
    for (const auto &n : body->nodes())
    {
        if (n.op == Opcode::Param)
            continue;
        return isScopeEnter(n);
    }
    return false;
}

} // namespace strata::transform
