//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the reference Interpreter for the graph IR. It evaluates
// nodes in program order and gives every opcode its defining semantics:
//
// - call: look up the callee in the registry and apply it to the operands
// - scope.enter / scope.exit: push / pop a frame of scope parameters; the exit
//   yields the last non-marker value computed inside its scope, or none
// - invoke: evaluate the named child graph with the operands as arguments
// - region: push the scope parameters, evaluate the body, pop, return the result
// - getitem: project one element of a tuple
//
// Callees observe the active scope frames through ExecContext, so a program
// whose calls behave differently inside a scope exposes any rewrite that moves
// a call across a scope boundary.
//
// Errors are reported as X500x diagnostics:
//   X5001 unknown callee         X5002 argument count mismatch
//   X5003 unbalanced scope exit   X5004 bad getitem
//   X5005 missing child graph     X5006 nesting too deep
//   X5007 unbound value
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Graph.hpp"
#include "ir/exec/RtValue.hpp"
#include "support/diag_expected.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata::exec
{

/// @brief Execution state visible to callees.
class ExecContext
{
  public:
    /// @brief Scope parameter frames, outermost first.
    [[nodiscard]] const std::vector<std::vector<RtValue>> &scopes() const
    {
        return scopes_;
    }

    /// @brief Parameters of the innermost active scope, or nullptr outside scopes.
    [[nodiscard]] const std::vector<RtValue> *innermostScope() const
    {
        return scopes_.empty() ? nullptr : &scopes_.back();
    }

  private:
    friend class Interpreter;
    std::vector<std::vector<RtValue>> scopes_;
};

using Callee = std::function<RtValue(const std::vector<RtValue> &args, const ExecContext &ctx)>;

class Interpreter
{
  public:
    /// @brief Make @p fn callable as `call name(...)`; replaces an earlier entry.
    void registerCallee(std::string name, Callee fn);

    /// @brief Evaluate @p g with @p args bound to its parameters in order.
    /// @return The value of the output node (None without one) or a diagnostic.
    support::Expected<RtValue> run(const core::Graph &g, const std::vector<RtValue> &args);

  private:
    support::Expected<RtValue> evalGraph(const core::Graph &g, const std::vector<RtValue> &args, unsigned depth);

    ExecContext ctx_;
    std::unordered_map<std::string, Callee> callees_;
};

} // namespace strata::exec
