//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/strata/ir/Verify.hpp
// Purpose: Stable façade exposing the graph verifier entry point.
// Key invariants: Mirrors strata::verify::Verifier public API only.
// Ownership/Lifetime: Caller retains ownership of graphs and diagnostics.
#pragma once

#include "ir/verify/Verifier.hpp"
