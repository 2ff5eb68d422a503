// File: src/ir/core/Opcode.hpp
// Purpose: Enumerates graph IR node kinds.
// Key invariants: Enumeration values match Opcode.def.
// Ownership/Lifetime: Not applicable.
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace strata::core
{

/// @brief Closed set of node kinds understood by the graph IR.
enum class Opcode
{
#define STRATA_OPCODE(NAME, ...) NAME,
#include "ir/core/Opcode.def"
#undef STRATA_OPCODE
    Count
};

/// @brief Total number of opcodes defined by the graph IR.
constexpr size_t kNumOpcodes = static_cast<size_t>(Opcode::Count);

/// @brief Convert opcode @p op to its textual mnemonic.
std::string toString(Opcode op);

/// @brief Look up the opcode spelled @p mnemonic.
/// @return Matching opcode or std::nullopt when the spelling is unknown.
std::optional<Opcode> opcodeFromMnemonic(std::string_view mnemonic);

/// @brief Whether nodes of kind @p op name a callee or child graph in @c Node::target.
bool hasTarget(Opcode op);

/// @brief Whether nodes of kind @p op define a value other nodes may reference.
bool producesValue(Opcode op);

} // namespace strata::core
