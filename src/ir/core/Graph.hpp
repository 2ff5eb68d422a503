//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Graph class, the unit of code organisation of the
// graph IR. A graph is an ordered sequence of nodes in SSA style together with
// the named child graphs it owns. Child graphs are the callable bodies that
// `invoke` and `graph.ref` nodes name through their target field.
//
// Key Invariants:
// - Node names are unique within the graph; node ids are never reused
// - Operands reference only nodes that appear earlier in the sequence
// - At most one output node exists and it is the last node
// - Child graph names are unique within the owning graph
//
// Mutation API:
// The graph exposes the small set of host operations rewriting passes are built
// from: insertion before an anchor, erasure of unused nodes, use replacement,
// renaming with unique-name allocation, and child graph management. Passes that
// iterate while mutating take a snapshot of node ids first and re-resolve each
// id, since insertion and erasure invalidate references into the node vector.
//
// Ownership Model:
// - Graph owns Nodes and child Graphs by value; copying a graph is a deep copy
// - An optional rename hook observes changes to the values the output node
//   refers to; it is not owned and must outlive its installation
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Node.hpp"
#include "support/diag_expected.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::core
{

/// @brief Ordered SSA graph with owned child graphs.
class Graph
{
  public:
    /// @brief Observer notified when the node feeding the output changes name.
    /// @details Receives the previous and the new name of the value the output
    ///          node refers to, either because a use was replaced or because the
    ///          referenced node was renamed.
    using OutputRenameHook = std::function<void(const std::string &, const std::string &)>;

    explicit Graph(std::string name = "main");

    [[nodiscard]] const std::string &name() const
    {
        return name_;
    }

    void setName(std::string name)
    {
        name_ = std::move(name);
    }

    /// @brief Nodes in program order.
    [[nodiscard]] const std::vector<Node> &nodes() const
    {
        return nodes_;
    }

    /// @brief Snapshot of node ids in program order.
    [[nodiscard]] std::vector<NodeId> nodeIds() const;

    [[nodiscard]] Node *find(NodeId id);
    [[nodiscard]] const Node *find(NodeId id) const;
    [[nodiscard]] Node *findByName(std::string_view name);
    [[nodiscard]] const Node *findByName(std::string_view name) const;

    /// @brief Position of node @p id in program order, or -1 when absent.
    [[nodiscard]] long indexOf(NodeId id) const;

    /// @brief The terminal output node, or nullptr when the graph returns nothing.
    [[nodiscard]] Node *output();
    [[nodiscard]] const Node *output() const;

    /// @brief Create a node at the end of the graph.
    /// @details Non-output nodes are placed before an existing output node so the
    ///          output stays terminal.
    /// @param nameHint Preferred name; made unique when already taken.
    Node &append(Opcode op, std::string target, std::vector<Value> operands, std::string_view nameHint);

    /// @brief Create a node immediately before node @p anchor.
    /// @pre @p anchor names a node of this graph.
    Node &insertBefore(NodeId anchor,
                       Opcode op,
                       std::string target,
                       std::vector<Value> operands,
                       std::string_view nameHint);

    /// @brief Erase node @p id.
    /// @return Error when the node is unknown or still has users.
    support::Expected<void> erase(NodeId id);

    /// @brief Ids of nodes whose operands reference @p id, in program order.
    [[nodiscard]] std::vector<NodeId> users(NodeId id) const;

    /// @brief Replace every reference to @p oldId with @p replacement.
    void replaceAllUsesWith(NodeId oldId, const Value &replacement);

    /// @brief Rename node @p id to @p desired, or a unique variant of it.
    /// @return The name actually assigned.
    const std::string &rename(NodeId id, std::string_view desired);

    /// @brief Produce @p hint, or `hint_N` for the smallest free N.
    [[nodiscard]] std::string uniqueName(std::string_view hint) const;

    /// @brief Child graphs owned by this graph.
    [[nodiscard]] const std::vector<Graph> &subgraphs() const
    {
        return subgraphs_;
    }

    [[nodiscard]] Graph *subgraph(std::string_view name);
    [[nodiscard]] const Graph *subgraph(std::string_view name) const;

    /// @brief Install @p g, replacing a child graph of the same name if present.
    Graph &setSubgraph(Graph g);

    /// @brief Remove the child graph called @p name.
    /// @return True when a child graph was removed.
    bool eraseSubgraph(std::string_view name);

    /// @brief Remove every child graph no graph.ref or invoke node names.
    /// @return Number of child graphs removed.
    size_t pruneUnusedSubgraphs();

    /// @brief Produce a child graph name based on @p hint that is not yet taken.
    [[nodiscard]] std::string uniqueSubgraphName(std::string_view hint) const;

    /// @brief Install @p hook and return the previously installed hook.
    OutputRenameHook setOutputRenameHook(OutputRenameHook hook);

  private:
    Node &insertAt(size_t index, Opcode op, std::string target, std::vector<Value> operands, std::string_view nameHint);
    bool nameTaken(std::string_view name) const;
    void notifyOutputRename(const std::string &oldName, const std::string &newName);

    std::string name_;
    std::vector<Node> nodes_;
    std::vector<Graph> subgraphs_;
    NodeId nextId_ = 0;
    OutputRenameHook outputRenameHook_;
};

/// @brief RAII helper installing an output rename hook for one scope.
class ScopedOutputRenameHook
{
  public:
    ScopedOutputRenameHook(Graph &graph, Graph::OutputRenameHook hook);
    ~ScopedOutputRenameHook();

    ScopedOutputRenameHook(const ScopedOutputRenameHook &) = delete;
    ScopedOutputRenameHook &operator=(const ScopedOutputRenameHook &) = delete;

  private:
    Graph &graph_;
    Graph::OutputRenameHook previous_;
};

} // namespace strata::core
