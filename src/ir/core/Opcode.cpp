// File: src/ir/core/Opcode.cpp
// Purpose: Implements opcode metadata queries generated from Opcode.def.
// Key invariants: Tables are indexed by the opcode enumerator value.
// Ownership/Lifetime: Static tables only.

#include "ir/core/Opcode.hpp"

#include <array>

namespace strata::core
{
namespace
{
struct OpcodeInfo
{
    const char *mnemonic;
    bool hasTarget;
    bool producesValue;
};

constexpr std::array<OpcodeInfo, kNumOpcodes> kOpcodeTable = {{
#define STRATA_OPCODE(NAME, MNEMONIC, TARGET, VALUE) {MNEMONIC, TARGET, VALUE},
#include "ir/core/Opcode.def"
#undef STRATA_OPCODE
}};

const OpcodeInfo *lookup(Opcode op)
{
    const auto index = static_cast<size_t>(op);
    if (index >= kOpcodeTable.size())
        return nullptr;
    return &kOpcodeTable[index];
}
} // namespace

std::string toString(Opcode op)
{
    if (const auto *info = lookup(op))
        return info->mnemonic;
    return "<invalid>";
}

std::optional<Opcode> opcodeFromMnemonic(std::string_view mnemonic)
{
    for (size_t i = 0; i < kOpcodeTable.size(); ++i)
    {
        if (mnemonic == kOpcodeTable[i].mnemonic)
            return static_cast<Opcode>(i);
    }
    return std::nullopt;
}

bool hasTarget(Opcode op)
{
    const auto *info = lookup(op);
    return info && info->hasTarget;
}

bool producesValue(Opcode op)
{
    const auto *info = lookup(op);
    return info && info->producesValue;
}

} // namespace strata::core
