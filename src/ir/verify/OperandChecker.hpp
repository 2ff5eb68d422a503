// File: src/ir/verify/OperandChecker.hpp
// Purpose: Declares the per-node operand layout check used by the verifier.
// Key invariants: Checks one node against its opcode's operand layout.
// Ownership/Lifetime: Borrowed graph and node; no state retained.
#pragma once

#include "ir/core/Graph.hpp"
#include "support/diag_expected.hpp"

#include <string>

namespace strata::verify
{

/// \brief Validate target and operand layout of node @p n in graph @p g.
/// \param where Graph path used to prefix diagnostics.
/// \return Empty on success; V2005 diagnostic otherwise.
support::Expected<void> checkOperandLayout(const core::Graph &g, const core::Node &n, const std::string &where);

} // namespace strata::verify
