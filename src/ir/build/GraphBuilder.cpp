//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements GraphBuilder. Every helper funnels through emit(), which checks
// that operands refer to existing nodes of the same graph and that an
// explicitly requested name is still free.
//
//===----------------------------------------------------------------------===//

#include "ir/build/GraphBuilder.hpp"

#include <stdexcept>
#include <utility>

using namespace strata::core;

namespace strata::build
{

GraphBuilder::GraphBuilder(Graph &g) : graph_(g) {}

void GraphBuilder::checkOperand(const Value &v) const
{
    forEachRef(v,
               [&](NodeId id)
               {
                   if (!graph_.find(id))
                       throw std::logic_error("operand references a node outside graph '" + graph_.name() + "'");
               });
}

Value GraphBuilder::emit(Opcode op,
                         std::string target,
                         std::vector<Value> operands,
                         const std::string &name,
                         Type type,
                         const std::string &defaultHint)
{
    if (graph_.output() != nullptr)
        throw std::logic_error("graph '" + graph_.name() + "' already has an output node");
    for (const auto &operand : operands)
        checkOperand(operand);
    if (!name.empty() && graph_.findByName(name))
        throw std::logic_error("name '%" + name + "' already defined in graph '" + graph_.name() + "'");
    std::string hint = name.empty() ? defaultHint : name;
    if (hint.empty())
        hint = op == Opcode::Call ? target : toString(op);
    for (auto &c : hint)
    {
        if (c == '.')
            c = '_';
    }
    Node &n = graph_.append(op, std::move(target), std::move(operands), hint);
    n.meta.val = std::move(type);
    return Value::ref(n.id);
}

Value GraphBuilder::param(const std::string &name, Type type)
{
    return emit(Opcode::Param, "", {}, name, std::move(type));
}

Value GraphBuilder::call(const std::string &callee, std::vector<Value> args, const std::string &name, Type type)
{
    if (callee.empty())
        throw std::logic_error("call: empty callee");
    return emit(Opcode::Call, callee, std::move(args), name, std::move(type));
}

Value GraphBuilder::enterScope(std::vector<Value> params, const std::string &name)
{
    return emit(Opcode::ScopeEnter, "", std::move(params), name, Type());
}

Value GraphBuilder::exitScope(Value enter, const std::string &name)
{
    if (!enter.isRef())
        throw std::logic_error("exitScope: operand must reference a scope.enter node");
    return emit(Opcode::ScopeExit, "", {std::move(enter)}, name, Type(Type::Kind::None));
}

Value GraphBuilder::graphRef(const std::string &target, const std::string &name)
{
    return emit(Opcode::GraphRef, target, {}, name, Type(), target);
}

Value GraphBuilder::invoke(const std::string &target, std::vector<Value> args, const std::string &name, Type type)
{
    return emit(Opcode::Invoke, target, std::move(args), name, std::move(type), target);
}

Value GraphBuilder::region(
    std::vector<Value> params, Value body, std::vector<Value> args, const std::string &name, Type type)
{
    std::vector<Value> operands;
    operands.reserve(args.size() + 2);
    operands.push_back(Value::list(std::move(params)));
    operands.push_back(std::move(body));
    for (auto &a : args)
        operands.push_back(std::move(a));
    return emit(Opcode::Region, "", std::move(operands), name, std::move(type), "scope_region");
}

Value GraphBuilder::getItem(Value source, long long index, const std::string &name, Type type)
{
    return emit(Opcode::GetItem, "", {std::move(source), Value::constInt(index)}, name, std::move(type));
}

void GraphBuilder::output(Value value)
{
    emit(Opcode::Output, "", {std::move(value)}, "", Type(), "output");
}

Node &GraphBuilder::node(const Value &ref)
{
    Node *n = ref.isRef() ? graph_.find(ref.id) : nullptr;
    if (!n)
        throw std::logic_error("node: value does not reference a node of graph '" + graph_.name() + "'");
    return *n;
}

Graph &GraphBuilder::subgraph(const std::string &name)
{
    return graph_.setSubgraph(Graph(name));
}

} // namespace strata::build
