// File: include/strata/ir/IO.hpp
// Purpose: Stable façade for graph text parsing and serialization.
// Key invariants: Re-exports supported IO interfaces; the lexer stays internal.
// Ownership/Lifetime: Parser/Serializer mirror underlying implementations.
#pragma once

#include "ir/io/Parser.hpp"
#include "ir/io/Serializer.hpp"

/// @file include/strata/ir/IO.hpp
/// @brief Aggregated public header for graph text IO.
