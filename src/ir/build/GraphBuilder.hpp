//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the GraphBuilder class, a small fluent API for
// constructing graphs programmatically. Tests and the text parser use it to
// build inputs for the rewriting passes.
//
// Typical Usage Pattern:
//   Graph g("main");
//   GraphBuilder b(g);
//   auto x = b.param("x", Type::tensor("f32", {4}));
//   auto enter = b.enterScope({Value::constStr("cuda"), Value::constStr("f16")});
//   auto y = b.call("g", {x}, "y");
//   b.exitScope(enter);
//   b.output(Value::list({y}));
//
// The builder does NOT own the graph it operates on. Misuse that would break a
// structural invariant (a second output, a reference to a node of another
// graph, a name clash when an exact name is requested) throws
// std::logic_error.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Graph.hpp"
#include "ir/core/Type.hpp"
#include "ir/core/Value.hpp"

#include <string>
#include <vector>

namespace strata::build
{

/// @brief Helper appending nodes to a graph in program order.
class GraphBuilder
{
  public:
    /// @brief Create builder operating on graph @p g.
    explicit GraphBuilder(core::Graph &g);

    /// @brief Append a graph input.
    core::Value param(const std::string &name, core::Type type = core::Type());

    /// @brief Append a call of @p callee.
    core::Value call(const std::string &callee,
                     std::vector<core::Value> args,
                     const std::string &name = "",
                     core::Type type = core::Type());

    /// @brief Append a scope-enter marker with scope parameters @p params.
    core::Value enterScope(std::vector<core::Value> params, const std::string &name = "");

    /// @brief Append the scope-exit marker closing @p enter.
    core::Value exitScope(core::Value enter, const std::string &name = "");

    /// @brief Append a reference to child graph @p target.
    core::Value graphRef(const std::string &target, const std::string &name = "");

    /// @brief Append an invocation of child graph @p target.
    core::Value invoke(const std::string &target,
                       std::vector<core::Value> args,
                       const std::string &name = "",
                       core::Type type = core::Type());

    /// @brief Append a region node running child @p body under @p params.
    core::Value region(std::vector<core::Value> params,
                       core::Value body,
                       std::vector<core::Value> args,
                       const std::string &name = "",
                       core::Type type = core::Type());

    /// @brief Append extraction of element @p index of multi-value @p source.
    core::Value getItem(core::Value source, long long index, const std::string &name = "", core::Type type = core::Type());

    /// @brief Append the terminal output node returning @p value.
    void output(core::Value value);

    /// @brief Access the node referenced by @p ref, e.g. to attach metadata.
    core::Node &node(const core::Value &ref);

    /// @brief Create (or replace) child graph @p name and return it for building.
    /// @note The reference is invalidated when another child graph is added.
    core::Graph &subgraph(const std::string &name);

  private:
    core::Value emit(core::Opcode op,
                     std::string target,
                     std::vector<core::Value> operands,
                     const std::string &name,
                     core::Type type,
                     const std::string &defaultHint = "");
    void checkOperand(const core::Value &v) const;

    core::Graph &graph_;
};

} // namespace strata::build
