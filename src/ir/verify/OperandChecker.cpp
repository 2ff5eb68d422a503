//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Operand layout rules, one switch arm per opcode. Reference validity is the
// caller's concern; this file only checks counts, kinds and targets.
//
//===----------------------------------------------------------------------===//

#include "ir/verify/OperandChecker.hpp"

using namespace strata::core;

namespace strata::verify
{

namespace
{

support::Diag layoutError(const std::string &where, const Node &n, const std::string &what)
{
    return support::makeError("V2005", {}, where + ": " + toString(n.op) + " '%" + n.name + "' " + what);
}

bool refersTo(const Graph &g, const Value &v, Opcode op)
{
    if (!v.isRef())
        return false;
    const Node *def = g.find(v.id);
    return def && def->op == op;
}

} // namespace

support::Expected<void> checkOperandLayout(const Graph &g, const Node &n, const std::string &where)
{
    if (hasTarget(n.op) && n.target.empty())
        return layoutError(where, n, "requires a target");
    if (!hasTarget(n.op) && !n.target.empty())
        return layoutError(where, n, "takes no target");

    const auto &ops = n.operands;
    switch (n.op)
    {
        case Opcode::Param:
        case Opcode::GraphRef:
            if (!ops.empty())
                return layoutError(where, n, "takes no operands");
            break;
        case Opcode::Call:
        case Opcode::ScopeEnter:
        case Opcode::Invoke:
            break;
        case Opcode::ScopeExit:
            if (ops.size() != 1 || !refersTo(g, ops[0], Opcode::ScopeEnter))
                return layoutError(where, n, "must take exactly one scope.enter reference");
            break;
        case Opcode::Region:
            if (ops.size() < 2)
                return layoutError(where, n, "requires scope parameters and a body");
            if (!ops[0].isList())
                return layoutError(where, n, "scope parameters must be a list");
            if (!refersTo(g, ops[1], Opcode::GraphRef))
                return layoutError(where, n, "body must reference a graph.ref node");
            break;
        case Opcode::GetItem:
            if (ops.size() != 2 || !ops[0].isRef())
                return layoutError(where, n, "requires a producer reference and an index");
            if (ops[1].kind != Value::Kind::ConstInt || ops[1].isBool || ops[1].i64 < 0)
                return layoutError(where, n, "index must be a non-negative integer constant");
            break;
        case Opcode::Output:
            if (ops.size() != 1)
                return layoutError(where, n, "must return exactly one value");
            break;
        case Opcode::Count:
            return layoutError(where, n, "has an invalid opcode");
    }
    return {};
}

} // namespace strata::verify
