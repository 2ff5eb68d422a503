//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Parser class, which reads graph text (`.sg`) and
// constructs the in-memory Graph it describes.
//
// Grammar (informal):
//   file     ::= 'graph' NAME '{' body '}'
//   body     ::= { node | 'output' value | 'subgraph' NAME '{' body '}' }
//   node     ::= %name '=' mnemonic [target] ['(' values ')'] [':' type] meta*
//   meta     ::= '!{' "key": "path", ... '}' | '!origin(' "name", "qualified" ')'
//   value    ::= %name | int | float | "string" | true | false | none | '(' values ')'
//   type     ::= '?' | none | i1 | i64 | f64 | str | dtype '[' dims ']' | '(' types ')'
//
// `param` and `graph.ref` take no operand list; every other node does.
// References must name a node defined earlier in the same graph, so parsed
// graphs are in definition-before-use order by construction.
//
// Errors are reported as P3001 diagnostics carrying the line and column of
// the offending token.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Graph.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <istream>
#include <string_view>

namespace strata::io
{

/// @brief Parses graph text into a Graph.
class Parser
{
  public:
    /// @brief Parse graph text from @p is.
    /// @param fileId Source manager id stamped on diagnostics.
    [[nodiscard]] static support::Expected<core::Graph> parse(std::istream &is, uint32_t fileId = 0);

    /// @brief Parse graph text held in @p text.
    [[nodiscard]] static support::Expected<core::Graph> parseString(std::string_view text, uint32_t fileId = 0);
};

} // namespace strata::io
