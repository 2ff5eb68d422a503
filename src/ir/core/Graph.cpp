//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the host mutation API of the graph IR: node creation and
// erasure, use replacement, unique naming, and child graph bookkeeping.
// Lookups are linear scans over the node vector.
//
//===----------------------------------------------------------------------===//

#include "ir/core/Graph.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace strata::core
{

Graph::Graph(std::string name) : name_(std::move(name)) {}

std::vector<NodeId> Graph::nodeIds() const
{
    std::vector<NodeId> ids;
    ids.reserve(nodes_.size());
    for (const auto &n : nodes_)
        ids.push_back(n.id);
    return ids;
}

Node *Graph::find(NodeId id)
{
    auto it = std::find_if(nodes_.begin(), nodes_.end(), [id](const Node &n) { return n.id == id; });
    return it == nodes_.end() ? nullptr : &*it;
}

const Node *Graph::find(NodeId id) const
{
    auto it = std::find_if(nodes_.begin(), nodes_.end(), [id](const Node &n) { return n.id == id; });
    return it == nodes_.end() ? nullptr : &*it;
}

Node *Graph::findByName(std::string_view name)
{
    auto it = std::find_if(nodes_.begin(), nodes_.end(), [name](const Node &n) { return n.name == name; });
    return it == nodes_.end() ? nullptr : &*it;
}

const Node *Graph::findByName(std::string_view name) const
{
    auto it = std::find_if(nodes_.begin(), nodes_.end(), [name](const Node &n) { return n.name == name; });
    return it == nodes_.end() ? nullptr : &*it;
}

long Graph::indexOf(NodeId id) const
{
    for (size_t i = 0; i < nodes_.size(); ++i)
    {
        if (nodes_[i].id == id)
            return static_cast<long>(i);
    }
    return -1;
}

Node *Graph::output()
{
    if (nodes_.empty() || nodes_.back().op != Opcode::Output)
        return nullptr;
    return &nodes_.back();
}

const Node *Graph::output() const
{
    if (nodes_.empty() || nodes_.back().op != Opcode::Output)
        return nullptr;
    return &nodes_.back();
}

Node &Graph::insertAt(
    size_t index, Opcode op, std::string target, std::vector<Value> operands, std::string_view nameHint)
{
    Node node;
    node.id = nextId_++;
    if (nameHint.empty())
        nameHint = op == Opcode::Output ? std::string_view("output") : std::string_view("node");
    node.name = uniqueName(nameHint);
    node.op = op;
    node.target = std::move(target);
    node.operands = std::move(operands);
    auto it = nodes_.insert(nodes_.begin() + static_cast<std::ptrdiff_t>(index), std::move(node));
    return *it;
}

Node &Graph::append(Opcode op, std::string target, std::vector<Value> operands, std::string_view nameHint)
{
    size_t index = nodes_.size();
    if (op != Opcode::Output && output() != nullptr)
        index = nodes_.size() - 1;
    return insertAt(index, op, std::move(target), std::move(operands), nameHint);
}

Node &Graph::insertBefore(
    NodeId anchor, Opcode op, std::string target, std::vector<Value> operands, std::string_view nameHint)
{
    const long index = indexOf(anchor);
    if (index < 0)
        throw std::logic_error("insertBefore: unknown anchor node in graph '" + name_ + "'");
    return insertAt(static_cast<size_t>(index), op, std::move(target), std::move(operands), nameHint);
}

support::Expected<void> Graph::erase(NodeId id)
{
    const long index = indexOf(id);
    if (index < 0)
        return support::makeError("I4001", {}, "cannot erase unknown node #" + std::to_string(id) +
                                                   " from graph '" + name_ + "'");
    const auto remaining = users(id);
    if (!remaining.empty())
    {
        const auto *user = find(remaining.front());
        return support::makeError("I4002",
                                  {},
                                  "cannot erase '%" + nodes_[static_cast<size_t>(index)].name +
                                      "' from graph '" + name_ + "': still used by '%" + user->name +
                                      "'");
    }
    nodes_.erase(nodes_.begin() + index);
    return {};
}

std::vector<NodeId> Graph::users(NodeId id) const
{
    std::vector<NodeId> result;
    for (const auto &n : nodes_)
    {
        if (usesNode(n, id))
            result.push_back(n.id);
    }
    return result;
}

void Graph::replaceAllUsesWith(NodeId oldId, const Value &replacement)
{
    const Node *old = find(oldId);
    const std::string oldName = old ? old->name : std::string();
    bool outputChanged = false;
    for (auto &n : nodes_)
    {
        if (n.id == oldId)
            continue;
        bool changed = false;
        for (auto &operand : n.operands)
        {
            rewriteRefs(operand,
                        [&](NodeId ref)
                        {
                            if (ref != oldId)
                                return Value::ref(ref);
                            changed = true;
                            return replacement;
                        });
        }
        if (changed && n.op == Opcode::Output)
            outputChanged = true;
    }
    if (outputChanged && replacement.isRef())
    {
        if (const Node *repl = find(replacement.id))
            notifyOutputRename(oldName, repl->name);
    }
}

const std::string &Graph::rename(NodeId id, std::string_view desired)
{
    Node *node = find(id);
    if (!node)
        throw std::logic_error("rename: unknown node in graph '" + name_ + "'");
    if (node->name == desired)
        return node->name;
    std::string oldName = node->name;
    // Free the current name first so renaming back and forth is stable.
    node->name.clear();
    node->name = uniqueName(desired);
    const Node *out = output();
    if (out && usesNode(*out, id))
        notifyOutputRename(oldName, node->name);
    return node->name;
}

bool Graph::nameTaken(std::string_view name) const
{
    return std::any_of(nodes_.begin(), nodes_.end(), [name](const Node &n) { return n.name == name; });
}

std::string Graph::uniqueName(std::string_view hint) const
{
    std::string base(hint.empty() ? std::string_view("node") : hint);
    if (!nameTaken(base))
        return base;
    for (unsigned suffix = 1;; ++suffix)
    {
        std::string candidate = base + "_" + std::to_string(suffix);
        if (!nameTaken(candidate))
            return candidate;
    }
}

Graph *Graph::subgraph(std::string_view name)
{
    auto it = std::find_if(subgraphs_.begin(), subgraphs_.end(), [name](const Graph &g) { return g.name() == name; });
    return it == subgraphs_.end() ? nullptr : &*it;
}

const Graph *Graph::subgraph(std::string_view name) const
{
    auto it = std::find_if(subgraphs_.begin(), subgraphs_.end(), [name](const Graph &g) { return g.name() == name; });
    return it == subgraphs_.end() ? nullptr : &*it;
}

Graph &Graph::setSubgraph(Graph g)
{
    if (Graph *existing = subgraph(g.name()))
    {
        *existing = std::move(g);
        return *existing;
    }
    subgraphs_.push_back(std::move(g));
    return subgraphs_.back();
}

bool Graph::eraseSubgraph(std::string_view name)
{
    auto it = std::find_if(subgraphs_.begin(), subgraphs_.end(), [name](const Graph &g) { return g.name() == name; });
    if (it == subgraphs_.end())
        return false;
    subgraphs_.erase(it);
    return true;
}

size_t Graph::pruneUnusedSubgraphs()
{
    std::unordered_set<std::string> referenced;
    for (const auto &n : nodes_)
    {
        if (n.op == Opcode::GraphRef || n.op == Opcode::Invoke)
            referenced.insert(n.target);
    }
    const size_t before = subgraphs_.size();
    subgraphs_.erase(std::remove_if(subgraphs_.begin(),
                                    subgraphs_.end(),
                                    [&](const Graph &g) { return referenced.count(g.name()) == 0; }),
                     subgraphs_.end());
    return before - subgraphs_.size();
}

std::string Graph::uniqueSubgraphName(std::string_view hint) const
{
    std::string base(hint);
    if (!subgraph(base))
        return base;
    for (unsigned suffix = 1;; ++suffix)
    {
        std::string candidate = base + "_" + std::to_string(suffix);
        if (!subgraph(candidate))
            return candidate;
    }
}

Graph::OutputRenameHook Graph::setOutputRenameHook(OutputRenameHook hook)
{
    std::swap(hook, outputRenameHook_);
    return hook;
}

void Graph::notifyOutputRename(const std::string &oldName, const std::string &newName)
{
    if (outputRenameHook_ && oldName != newName)
        outputRenameHook_(oldName, newName);
}

ScopedOutputRenameHook::ScopedOutputRenameHook(Graph &graph, Graph::OutputRenameHook hook)
    : graph_(graph), previous_(graph.setOutputRenameHook(std::move(hook)))
{
}

ScopedOutputRenameHook::~ScopedOutputRenameHook()
{
    graph_.setOutputRenameHook(std::move(previous_));
}

} // namespace strata::core
