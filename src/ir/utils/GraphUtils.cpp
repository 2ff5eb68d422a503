//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ir/utils/GraphUtils.cpp
// Purpose: Implement graph helper routines shared by the rewriting passes.
// Key invariants: Inlining preserves program order of the spliced body.
// Ownership/Lifetime: Child graphs are copied before the parent is mutated.
//
//===----------------------------------------------------------------------===//

#include "ir/utils/GraphUtils.hpp"

#include <string>
#include <unordered_map>

using namespace strata::core;

namespace strata::utils
{

std::vector<NodeId> filterNodes(const Graph &g, const NodePredicate &pred)
{
    std::vector<NodeId> ids;
    for (const auto &n : g.nodes())
    {
        if (pred(n))
            ids.push_back(n.id);
    }
    return ids;
}

const Node *firstNode(const Graph &g, const NodePredicate &pred)
{
    for (const auto &n : g.nodes())
    {
        if (pred(n))
            return &n;
    }
    return nullptr;
}

support::Expected<void> replaceNode(Graph &g, NodeId oldId, const Value &replacement)
{
    g.replaceAllUsesWith(oldId, replacement);
    return g.erase(oldId);
}

namespace
{

/// Value mapping from child node ids to values of the parent graph.
using ValueMap = std::unordered_map<NodeId, Value>;

/// Translate @p v through @p env; returns false if a reference is unmapped.
bool remap(Value &v, const ValueMap &env)
{
    bool ok = true;
    rewriteRefs(v,
                [&](NodeId id)
                {
                    auto it = env.find(id);
                    if (it == env.end())
                    {
                        ok = false;
                        return Value::none();
                    }
                    return it->second;
                });
    return ok;
}

} // namespace

support::Expected<void> inlineInvoke(Graph &parent, NodeId invokeId)
{
    const Node *call = parent.find(invokeId);
    if (!call || call->op != Opcode::Invoke)
        return support::makeError("I4003", {}, "inlineInvoke: node is not an invoke in graph '" + parent.name() + "'");
    const Graph *childPtr = parent.subgraph(call->target);
    if (!childPtr)
        return support::makeError(
            "I4004", {}, "inlineInvoke: unknown child graph '" + call->target + "' in graph '" + parent.name() + "'");

    // Copy: the parent's child list may grow while nested children are lifted.
    const Graph child = *childPtr;
    const std::vector<Value> args = call->operands;

    ValueMap env;
    size_t nextArg = 0;
    for (const auto &n : child.nodes())
    {
        if (n.op == Opcode::Output)
            break;
        if (n.op == Opcode::Param)
        {
            if (nextArg >= args.size())
                return support::makeError("I4005",
                                          {},
                                          "inlineInvoke: '" + child.name() + "' expects more than " +
                                              std::to_string(args.size()) + " argument(s)");
            env[n.id] = args[nextArg++];
            continue;
        }
        std::vector<Value> operands = n.operands;
        for (auto &operand : operands)
        {
            if (!remap(operand, env))
                return support::makeError(
                    "I4006", {}, "inlineInvoke: '%" + n.name + "' in '" + child.name() + "' uses an undefined value");
        }
        Node &copy = parent.insertBefore(invokeId, n.op, n.target, std::move(operands), n.name);
        copy.meta = n.meta;
        env[n.id] = Value::ref(copy.id);
        if ((n.op == Opcode::GraphRef || n.op == Opcode::Invoke) && !parent.subgraph(n.target))
        {
            if (const Graph *nested = child.subgraph(n.target))
                parent.setSubgraph(*nested);
        }
    }

    const Node *out = child.output();
    if (!out)
        return parent.erase(invokeId);

    Value result = out->operands.empty() ? Value::none() : out->operands.front();
    if (!remap(result, env))
        return support::makeError("I4006", {}, "inlineInvoke: output of '" + child.name() + "' uses an undefined value");

    if (!result.isList())
        return replaceNode(parent, invokeId, result);

    for (NodeId userId : parent.users(invokeId))
    {
        const Node *user = parent.find(userId);
        if (user->op != Opcode::GetItem || user->operands.size() != 2 ||
            user->operands[1].kind != Value::Kind::ConstInt)
            return support::makeError(
                "I4007", {}, "inlineInvoke: multi-valued '%" + user->name + "' operand is not a getitem projection");
        const long long index = user->operands[1].i64;
        if (index < 0 || static_cast<size_t>(index) >= result.elems.size())
            return support::makeError("I4007",
                                      {},
                                      "inlineInvoke: getitem index " + std::to_string(index) + " out of range for '" +
                                          child.name() + "'");
        if (auto r = replaceNode(parent, userId, result.elems[static_cast<size_t>(index)]); !r)
            return r;
    }
    return parent.erase(invokeId);
}

} // namespace strata::utils
