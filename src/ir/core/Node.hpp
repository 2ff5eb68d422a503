//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Node struct, a single instruction of a graph. The
// operand layout depends on the opcode:
//
//   param                      no operands
//   call <callee>              call arguments
//   scope.enter                scope parameters
//   scope.exit                 [ref enter]
//   graph.ref <child>          no operands
//   invoke <child>             arguments bound to the child's params in order
//   region                     [list(scope params), ref graph.ref, args...]
//   getitem                    [ref producer, int index]
//   output                     exactly one value
//
// Ownership Model:
// - Graph owns Nodes by value in a std::vector
// - Nodes reference each other only through Value::ref ids
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Meta.hpp"
#include "ir/core/Opcode.hpp"
#include "ir/core/Value.hpp"

#include <string>
#include <vector>

namespace strata::core
{

/// @brief Instruction within a graph.
struct Node
{
    /// Identifier unique within the owning graph; never reused.
    NodeId id = 0;

    /// Name unique within the owning graph; printed as %name.
    std::string name;

    /// Operation kind.
    Opcode op = Opcode::Call;

    /// Callee for call, child graph name for graph.ref and invoke; empty otherwise.
    std::string target;

    /// Operands in opcode-specific layout.
    std::vector<Value> operands;

    /// Auxiliary metadata.
    Meta meta;
};

/// @brief Whether any operand of @p node references node @p id.
bool usesNode(const Node &node, NodeId id);

} // namespace strata::core
