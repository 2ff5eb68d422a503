//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares global tool settings shared by the command-line drivers.
// Key invariants: None.
// Ownership/Lifetime: Caller owns option values.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace strata::support
{

/// @brief Holds global command-line settings that influence tool behavior.
/// @invariant Flags are independent booleans.
struct Options
{
    /// @brief Enable verbose tracing of rewriting steps.
    bool trace = false;

    /// @brief Run the graph verifier on the rewritten result.
    bool verify = true;
};

} // namespace strata::support
