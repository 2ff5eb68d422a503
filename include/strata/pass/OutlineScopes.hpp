//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/strata/pass/OutlineScopes.hpp
// Purpose: Public entry point of the scope outlining pass.
// Key invariants: Re-exports outlineScopes(), its configuration, the output
//                 signature type and the pass diagnostic codes.
// Ownership/Lifetime: The pass returns new graphs; inputs are never modified.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/transform/OutlineDiagnostics.hpp"
#include "ir/transform/OutlineScopes.hpp"
#include "ir/transform/OutputSignature.hpp"
