// File: include/strata/ir/GraphBuilder.hpp
// Purpose: Stable façade for constructing graphs without depending on src paths.
// Key invariants: Mirrors strata::build::GraphBuilder API; no additional behavior.
// Ownership/Lifetime: The builder never owns the graph it extends.
#pragma once

#include "ir/build/GraphBuilder.hpp"
