//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Verifier class, the structural lint of the graph IR.
// Rewriting passes run it on their result; the command-line tool runs it on
// parsed input.
//
// Checked rules, per graph and recursively per child graph:
// - node names are non-empty and unique (V2001)
// - operands reference existing (V2002), earlier (V2003) nodes that produce a
//   value (V2010)
// - at most one output node, placed last (V2004)
// - opcode-specific operand layout (V2005)
// - graph.ref and invoke targets name an existing child graph (V2006)
// - invoke and region argument counts match the callee's parameters (V2007)
// - getitem indices are in range of a multi-valued producer (V2008)
// - child graph names are unique (V2009)
//
// The first violation stops verification and is returned as a diagnostic.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

namespace strata::core
{
class Graph;
}

namespace strata::verify
{

/// @brief Verifies structural rules for a graph and its children.
class Verifier
{
  public:
    /// @brief Verify graph @p g and every child graph it owns.
    /// @return Expected success or diagnostic on failure.
    [[nodiscard]] static support::Expected<void> verify(const core::Graph &g);
};

} // namespace strata::verify
