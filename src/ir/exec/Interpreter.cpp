//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the graph interpreter. Each graph activation keeps its own value
// environment keyed by node id; the scope stack is shared by all activations
// of one run() so that scopes entered in a caller are visible in the callee.
//
//===----------------------------------------------------------------------===//

#include "ir/exec/Interpreter.hpp"

#include "ir/transform/ScopeMarkers.hpp"

#include <utility>

using namespace strata::core;

namespace strata::exec
{

namespace
{

constexpr unsigned kMaxDepth = 256;

using Env = std::unordered_map<NodeId, RtValue>;

support::Expected<RtValue> evalOperand(const Value &v, const Env &env)
{
    switch (v.kind)
    {
        case Value::Kind::NodeRef:
        {
            auto it = env.find(v.id);
            if (it == env.end())
                return support::makeError("X5007", {}, "value #" + std::to_string(v.id) + " is not bound");
            return it->second;
        }
        case Value::Kind::ConstInt:
            return v.isBool ? RtValue::boolean(v.i64 != 0) : RtValue::integer(v.i64);
        case Value::Kind::ConstFloat:
            return RtValue::real(v.f64);
        case Value::Kind::ConstStr:
            return RtValue::string(v.str);
        case Value::Kind::None:
            return RtValue::none();
        case Value::Kind::List:
        {
            std::vector<RtValue> elems;
            for (const auto &e : v.elems)
            {
                auto r = evalOperand(e, env);
                if (!r)
                    return r;
                elems.push_back(std::move(r.value()));
            }
            return RtValue::tuple(std::move(elems));
        }
    }
    return RtValue::none();
}

support::Expected<std::vector<RtValue>> evalOperands(const Node &n, size_t first, const Env &env)
{
    std::vector<RtValue> values;
    for (size_t i = first; i < n.operands.size(); ++i)
    {
        auto r = evalOperand(n.operands[i], env);
        if (!r)
            return r.error();
        values.push_back(std::move(r.value()));
    }
    return values;
}

} // namespace

void Interpreter::registerCallee(std::string name, Callee fn)
{
    callees_[std::move(name)] = std::move(fn);
}

support::Expected<RtValue> Interpreter::run(const Graph &g, const std::vector<RtValue> &args)
{
    ctx_.scopes_.clear();
    auto result = evalGraph(g, args, 0);
    if (result && !ctx_.scopes_.empty())
        return support::makeError("X5003",
                                  {},
                                  "graph '" + g.name() + "' finished with " + std::to_string(ctx_.scopes_.size()) +
                                      " open scope(s)");
    return result;
}

support::Expected<RtValue> Interpreter::evalGraph(const Graph &g, const std::vector<RtValue> &args, unsigned depth)
{
    if (depth > kMaxDepth)
        return support::makeError("X5006", {}, "graph nesting deeper than " + std::to_string(kMaxDepth));

    size_t paramCount = 0;
    for (const auto &n : g.nodes())
    {
        if (n.op == Opcode::Param)
            ++paramCount;
    }
    if (paramCount != args.size())
        return support::makeError("X5002",
                                  {},
                                  "graph '" + g.name() + "' takes " + std::to_string(paramCount) + " argument(s), got " +
                                      std::to_string(args.size()));

    Env env;
    size_t nextArg = 0;
    for (const auto &n : g.nodes())
    {
        RtValue result;
        switch (n.op)
        {
            case Opcode::Param:
                result = args[nextArg++];
                break;
            case Opcode::Call:
            {
                auto it = callees_.find(n.target);
                if (it == callees_.end())
                    return support::makeError("X5001", {}, "unknown callee '" + n.target + "'");
                auto operands = evalOperands(n, 0, env);
                if (!operands)
                    return operands.error();
                result = it->second(operands.value(), ctx_);
                break;
            }
            case Opcode::ScopeEnter:
            {
                auto params = evalOperands(n, 0, env);
                if (!params)
                    return params.error();
                ctx_.scopes_.push_back(std::move(params.value()));
                result = RtValue::scope(static_cast<long long>(ctx_.scopes_.size()));
                break;
            }
            case Opcode::ScopeExit:
            {
                auto handle = evalOperand(n.operands.empty() ? Value::none() : n.operands.front(), env);
                if (!handle)
                    return handle.error();
                const auto &h = handle.value();
                if (h.kind != RtValue::Kind::Scope || h.i64 != static_cast<long long>(ctx_.scopes_.size()))
                    return support::makeError("X5003", {}, "'%" + n.name + "' does not close the innermost scope");
                ctx_.scopes_.pop_back();
                if (const Node *carried = transform::scopeResultNode(g, n))
                    result = env.at(carried->id);
                break;
            }
            case Opcode::GraphRef:
                if (!g.subgraph(n.target))
                    return support::makeError("X5005", {}, "unknown child graph '" + n.target + "'");
                result = RtValue::graph(n.target);
                break;
            case Opcode::Invoke:
            {
                const Graph *child = g.subgraph(n.target);
                if (!child)
                    return support::makeError("X5005", {}, "unknown child graph '" + n.target + "'");
                auto operands = evalOperands(n, 0, env);
                if (!operands)
                    return operands.error();
                auto r = evalGraph(*child, operands.value(), depth + 1);
                if (!r)
                    return r;
                result = std::move(r.value());
                break;
            }
            case Opcode::Region:
            {
                if (n.operands.size() < 2)
                    return support::makeError("X5002", {}, "region '%" + n.name + "' lacks parameters or body");
                auto params = evalOperand(n.operands[0], env);
                if (!params)
                    return params.error();
                auto body = evalOperand(n.operands[1], env);
                if (!body)
                    return body.error();
                const Graph *child =
                    body.value().kind == RtValue::Kind::Graph ? g.subgraph(body.value().str) : nullptr;
                if (!child)
                    return support::makeError("X5005", {}, "region '%" + n.name + "' has no body graph");
                auto operands = evalOperands(n, 2, env);
                if (!operands)
                    return operands.error();
                ctx_.scopes_.push_back(params.value().elems);
                auto r = evalGraph(*child, operands.value(), depth + 1);
                if (!r)
                    return r;
                ctx_.scopes_.pop_back();
                result = std::move(r.value());
                break;
            }
            case Opcode::GetItem:
            {
                auto source = evalOperand(n.operands.empty() ? Value::none() : n.operands.front(), env);
                if (!source)
                    return source.error();
                const long long index = n.operands.size() > 1 ? n.operands[1].i64 : -1;
                const auto &tuple = source.value();
                if (tuple.kind != RtValue::Kind::Tuple || index < 0 ||
                    static_cast<size_t>(index) >= tuple.elems.size())
                    return support::makeError(
                        "X5004", {}, "getitem '%" + n.name + "' cannot index " + toString(tuple));
                result = tuple.elems[static_cast<size_t>(index)];
                break;
            }
            case Opcode::Output:
                return evalOperand(n.operands.empty() ? Value::none() : n.operands.front(), env);
            case Opcode::Count:
                return support::makeError("X5002", {}, "invalid opcode");
        }
        env[n.id] = std::move(result);
    }
    return RtValue::none();
}

} // namespace strata::exec
