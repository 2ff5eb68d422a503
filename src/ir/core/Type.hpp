// File: src/ir/core/Type.hpp
// Purpose: Declares the static result type descriptor attached to node metadata.
// Key invariants: dtype/shape are meaningful only for Tensor; elems only for Tuple.
// Ownership/Lifetime: Value type.
#pragma once

#include <string>
#include <vector>

namespace strata::core
{

/// @brief Result type and shape recorded for a node.
struct Type
{
    /// @brief Enumerates the type categories.
    enum class Kind
    {
        Unknown,
        None,
        I1,
        I64,
        F64,
        Str,
        Tensor,
        Tuple
    };

    Kind kind;                    ///< Discriminator specifying the active kind
    std::string dtype;            ///< Element type name of a tensor, e.g. f16
    std::vector<long long> shape; ///< Tensor dimensions
    std::vector<Type> elems;      ///< Members of a tuple

    /// @brief Construct a type of kind @p k.
    explicit Type(Kind k = Kind::Unknown);

    /// @brief Construct a tensor type.
    static Type tensor(std::string dtype, std::vector<long long> shape);

    /// @brief Construct a tuple type of @p elems.
    static Type tuple(std::vector<Type> elems);

    /// @brief Convert type to its textual form, e.g. `f32[4,4]` or `(i64, f64)`.
    std::string toString() const;

    [[nodiscard]] bool isKnown() const
    {
        return kind != Kind::Unknown;
    }
};

bool operator==(const Type &a, const Type &b);
bool operator!=(const Type &a, const Type &b);

/// @brief Mnemonic of a scalar kind; empty for Tensor, Tuple and Unknown.
std::string kindToString(Type::Kind k);

} // namespace strata::core
