// File: src/ir/core/Node.cpp
// Purpose: Implements operand queries on graph nodes.
// Key invariants: Nested list operands are searched recursively.
// Ownership/Lifetime: Operates on caller-owned nodes.

#include "ir/core/Node.hpp"

namespace strata::core
{

bool usesNode(const Node &node, NodeId id)
{
    bool found = false;
    for (const auto &operand : node.operands)
    {
        forEachRef(operand,
                   [&](NodeId ref)
                   {
                       if (ref == id)
                           found = true;
                   });
        if (found)
            return true;
    }
    return false;
}

} // namespace strata::core
