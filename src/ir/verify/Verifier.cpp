//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the Verifier facade. A graph is checked node by node in program
// order, which makes the definition-before-use rule a simple "seen so far"
// test. Child graphs are verified after their parent, depth first, with
// diagnostics naming the slash-separated path of the offending graph.
//
//===----------------------------------------------------------------------===//

#include "ir/verify/Verifier.hpp"

#include "ir/core/Graph.hpp"
#include "ir/verify/OperandChecker.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

using namespace strata::core;

namespace strata::verify
{

namespace
{

size_t paramCount(const Graph &g)
{
    size_t count = 0;
    for (const auto &n : g.nodes())
    {
        if (n.op == Opcode::Param)
            ++count;
    }
    return count;
}

/// Number of values returned by @p g when its output is a list.
std::optional<size_t> tupleArity(const Graph &g)
{
    const Node *out = g.output();
    if (!out || out->operands.size() != 1 || !out->operands.front().isList())
        return std::nullopt;
    return out->operands.front().elems.size();
}

support::Diag error(const char *code, const std::string &where, const std::string &msg)
{
    return support::makeError(code, {}, where + ": " + msg);
}

class GraphChecker
{
  public:
    GraphChecker(const Graph &g, std::string where) : g_(g), where_(std::move(where)) {}

    support::Expected<void> run()
    {
        const auto &nodes = g_.nodes();
        for (size_t i = 0; i < nodes.size(); ++i)
        {
            if (auto r = checkNode(nodes[i], i + 1 == nodes.size()); !r)
                return r;
            seen_.emplace(nodes[i].id, &nodes[i]);
        }

        std::unordered_set<std::string> childNames;
        for (const auto &child : g_.subgraphs())
        {
            if (!childNames.insert(child.name()).second)
                return error("V2009", where_, "duplicate child graph '" + child.name() + "'");
        }
        for (const auto &child : g_.subgraphs())
        {
            GraphChecker nested(child, where_ + "/" + child.name());
            if (auto r = nested.run(); !r)
                return r;
        }
        return {};
    }

  private:
    support::Expected<void> checkNode(const Node &n, bool last)
    {
        if (n.name.empty())
            return error("V2001", where_, toString(n.op) + " node without a name");
        if (!names_.insert(n.name).second)
            return error("V2001", where_, "duplicate name '%" + n.name + "'");
        if (n.op == Opcode::Output && !last)
            return error("V2004", where_, "output '%" + n.name + "' is not the last node");

        for (const auto &operand : n.operands)
        {
            std::optional<support::Diag> bad;
            forEachRef(operand,
                       [&](NodeId id)
                       {
                           if (bad)
                               return;
                           auto it = seen_.find(id);
                           if (it != seen_.end())
                           {
                               if (!producesValue(it->second->op))
                                   bad = error("V2010", where_, "'%" + n.name + "' uses valueless node");
                               return;
                           }
                           if (g_.find(id))
                               bad = error("V2003", where_, "'%" + n.name + "' uses a value defined after it");
                           else
                               bad = error("V2002", where_, "'%" + n.name + "' uses an unknown node");
                       });
            if (bad)
                return *bad;
        }

        if (auto r = checkOperandLayout(g_, n, where_); !r)
            return r;

        switch (n.op)
        {
            case Opcode::GraphRef:
                if (!g_.subgraph(n.target))
                    return error("V2006", where_, "graph.ref '%" + n.name + "' names missing child '" + n.target + "'");
                break;
            case Opcode::Invoke:
                return checkCall(n, n.target, n.operands.size());
            case Opcode::Region:
                return checkCall(n, seen_.at(n.operands[1].id)->target, n.operands.size() - 2);
            case Opcode::GetItem:
                return checkGetItem(n);
            default:
                break;
        }
        return {};
    }

    support::Expected<void> checkCall(const Node &n, const std::string &target, size_t argCount) const
    {
        const Graph *callee = g_.subgraph(target);
        if (!callee)
            return error("V2006", where_, "'%" + n.name + "' calls missing child '" + target + "'");
        const size_t expected = paramCount(*callee);
        if (expected != argCount)
            return error("V2007",
                         where_,
                         "'%" + n.name + "' passes " + std::to_string(argCount) + " argument(s) to '" + target +
                             "' which takes " + std::to_string(expected));
        return {};
    }

    support::Expected<void> checkGetItem(const Node &n) const
    {
        const Node *producer = seen_.at(n.operands[0].id);
        std::string target;
        if (producer->op == Opcode::Invoke)
            target = producer->target;
        else if (producer->op == Opcode::Region)
            target = seen_.at(producer->operands[1].id)->target;
        else
            return {};
        const Graph *callee = g_.subgraph(target);
        const auto arity = callee ? tupleArity(*callee) : std::nullopt;
        if (!arity)
            return error("V2008", where_, "getitem '%" + n.name + "' reads a single-valued '%" + producer->name + "'");
        if (static_cast<size_t>(n.operands[1].i64) >= *arity)
            return error("V2008",
                         where_,
                         "getitem '%" + n.name + "' index " + std::to_string(n.operands[1].i64) + " out of range for " +
                             std::to_string(*arity) + " value(s)");
        return {};
    }

    const Graph &g_;
    std::string where_;
    std::unordered_map<NodeId, const Node *> seen_;
    std::unordered_set<std::string> names_;
};

} // namespace

support::Expected<void> Verifier::verify(const Graph &g)
{
    GraphChecker checker(g, g.name());
    return checker.run();
}

} // namespace strata::verify
