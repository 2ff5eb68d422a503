//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Serializer class, which converts graphs to their
// textual representation. The output is accepted by Parser, and parsing the
// printed form of a structurally valid graph yields an equivalent graph (same
// names, operations, operands and metadata; node ids may differ).
//
// Child graphs are printed after the parent's nodes, nested inside the
// parent's braces and indented one level deeper.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Graph.hpp"

#include <ostream>
#include <string>

namespace strata::io
{

/// @brief Serializes graphs to their textual form.
class Serializer
{
  public:
    /// @brief Write graph @p g (and its children) to @p os.
    static void write(const core::Graph &g, std::ostream &os);

    /// @brief Serialize graph @p g to a string.
    static std::string toString(const core::Graph &g);

    /// @brief Render operand @p v as it appears inside graph @p g.
    static std::string formatValue(const core::Graph &g, const core::Value &v);
};

} // namespace strata::io
