//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements sequential splitting. The pass first assigns every node a segment
// number by consulting the boundary callback in program order. It then derives
// each segment's live-in values (operands defined outside the segment) and
// live-out values (nodes of the segment read by a later segment or by the
// output node), materialises one child graph per segment, and rebuilds the
// top-level graph as a chain of invocations.
//
//===----------------------------------------------------------------------===//

#include "ir/transform/SequentialSplit.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <unordered_map>

using namespace strata::core;

namespace strata::transform
{

namespace
{

struct Segment
{
    unsigned number = 0;
    std::vector<NodeId> members;
    std::vector<NodeId> inputs;
    std::vector<NodeId> outputs;
};

void addUnique(std::vector<NodeId> &list, NodeId id)
{
    if (std::find(list.begin(), list.end(), id) == list.end())
        list.push_back(id);
}

bool staysInTopLevel(const Node &n)
{
    return n.op == Opcode::Param || n.op == Opcode::Output;
}

support::Diag undefinedValue(const Graph &g, const Node &user)
{
    return support::makeError(
        "I4006", {}, "sequentialSplit: '%" + user.name + "' in graph '" + g.name() + "' uses an undefined value");
}

} // namespace

support::Expected<Graph> sequentialSplit(const Graph &g, const SegmentBoundaryFn &startsNewSegment)
{
    // Assign segment numbers; the callback sees every node exactly once.
    std::unordered_map<NodeId, unsigned> numberOf;
    unsigned current = 0;
    for (const auto &n : g.nodes())
    {
        if (startsNewSegment(n))
            ++current;
        numberOf[n.id] = current;
    }

    std::vector<Segment> segments;
    std::map<unsigned, size_t> segmentIndex;
    std::unordered_map<NodeId, size_t> owner;
    for (const auto &n : g.nodes())
    {
        if (staysInTopLevel(n))
            continue;
        const unsigned number = numberOf[n.id];
        auto [it, inserted] = segmentIndex.emplace(number, segments.size());
        if (inserted)
        {
            segments.emplace_back();
            segments.back().number = number;
        }
        segments[it->second].members.push_back(n.id);
        owner[n.id] = it->second;
    }

    std::unordered_map<NodeId, size_t> position;
    for (size_t i = 0; i < g.nodes().size(); ++i)
        position[g.nodes()[i].id] = i;

    // Live-in and live-out discovery in first-use order.
    for (const auto &n : g.nodes())
    {
        const auto userOwner = owner.find(n.id);
        bool dangling = false;
        for (const auto &operand : n.operands)
        {
            forEachRef(operand,
                       [&](NodeId ref)
                       {
                           const auto def = position.find(ref);
                           if (def == position.end() || def->second >= position[n.id])
                           {
                               dangling = true;
                               return;
                           }
                           const auto defOwner = owner.find(ref);
                           const bool sameSegment = userOwner != owner.end() && defOwner != owner.end() &&
                                                    userOwner->second == defOwner->second;
                           if (sameSegment)
                               return;
                           if (userOwner != owner.end())
                               addUnique(segments[userOwner->second].inputs, ref);
                           if (defOwner != owner.end())
                               addUnique(segments[defOwner->second].outputs, ref);
                       });
        }
        if (dangling)
            return undefinedValue(g, n);
    }

    Graph top(g.name());
    for (const auto &child : g.subgraphs())
        top.setSubgraph(child);

    std::unordered_map<NodeId, Value> env;
    for (const auto &n : g.nodes())
    {
        if (n.op != Opcode::Param)
            continue;
        Node &p = top.append(Opcode::Param, "", {}, n.name);
        p.meta = n.meta;
        env[n.id] = Value::ref(p.id);
    }

    for (const auto &seg : segments)
    {
        const std::string childName = top.uniqueSubgraphName("submod_" + std::to_string(seg.number));
        Graph child(childName);
        std::unordered_map<NodeId, NodeId> local;
        auto toLocal = [&](NodeId ref) { return Value::ref(local.at(ref)); };

        for (NodeId in : seg.inputs)
        {
            const Node *src = g.find(in);
            Node &p = child.append(Opcode::Param, "", {}, src->name);
            p.meta = src->meta;
            local[in] = p.id;
        }
        for (NodeId m : seg.members)
        {
            const Node *src = g.find(m);
            std::vector<Value> operands = src->operands;
            for (auto &operand : operands)
                rewriteRefs(operand, toLocal);
            Node &copy = child.append(src->op, src->target, std::move(operands), src->name);
            copy.meta = src->meta;
            local[m] = copy.id;
            if (src->op == Opcode::GraphRef || src->op == Opcode::Invoke)
            {
                const Graph *nested = g.subgraph(src->target);
                if (nested && !child.subgraph(src->target))
                    child.setSubgraph(*nested);
            }
        }
        if (seg.outputs.size() == 1)
        {
            child.append(Opcode::Output, "", {Value::ref(local.at(seg.outputs.front()))}, "output");
        }
        else if (!seg.outputs.empty())
        {
            std::vector<Value> elems;
            for (NodeId o : seg.outputs)
                elems.push_back(Value::ref(local.at(o)));
            child.append(Opcode::Output, "", {Value::list(std::move(elems))}, "output");
        }
        top.setSubgraph(std::move(child));

        std::vector<Value> args;
        args.reserve(seg.inputs.size());
        for (NodeId in : seg.inputs)
            args.push_back(env.at(in));
        Node &call = top.append(Opcode::Invoke, childName, std::move(args), childName);
        const NodeId callId = call.id;
        if (seg.outputs.size() == 1)
        {
            call.meta = g.find(seg.outputs.front())->meta;
            env[seg.outputs.front()] = Value::ref(callId);
            continue;
        }
        for (size_t i = 0; i < seg.outputs.size(); ++i)
        {
            Node &item = top.append(
                Opcode::GetItem, "", {Value::ref(callId), Value::constInt(static_cast<long long>(i))}, "getitem");
            item.meta = g.find(seg.outputs[i])->meta;
            env[seg.outputs[i]] = Value::ref(item.id);
        }
    }

    if (const Node *out = g.output())
    {
        std::vector<Value> operands = out->operands;
        for (auto &operand : operands)
            rewriteRefs(operand, [&](NodeId ref) { return env.at(ref); });
        top.append(Opcode::Output, "", std::move(operands), out->name);
    }
    return top;
}

} // namespace strata::transform
