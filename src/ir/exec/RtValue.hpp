// File: src/ir/exec/RtValue.hpp
// Purpose: Runtime values produced while interpreting a graph.
// Key invariants: Exactly one payload field is meaningful for a given kind.
// Ownership/Lifetime: Value type; tuples own their elements.
#pragma once

#include <string>
#include <vector>

namespace strata::exec
{

/// @brief Dynamically typed value flowing between interpreted nodes.
struct RtValue
{
    enum class Kind
    {
        None,
        Int,
        Bool,
        Float,
        Str,
        Tuple,
        Scope, ///< Handle returned by scope.enter; i64 is the stack depth
        Graph  ///< Handle returned by graph.ref; str is the child graph name
    };

    Kind kind = Kind::None;
    long long i64 = 0;
    double f64 = 0.0;
    std::string str;
    std::vector<RtValue> elems;

    static RtValue none();
    static RtValue integer(long long v);
    static RtValue boolean(bool v);
    static RtValue real(double v);
    static RtValue string(std::string s);
    static RtValue tuple(std::vector<RtValue> elems);
    static RtValue scope(long long depth);
    static RtValue graph(std::string name);
};

bool operator==(const RtValue &a, const RtValue &b);
bool operator!=(const RtValue &a, const RtValue &b);

/// @brief Render @p v for diagnostics and test failure messages.
std::string toString(const RtValue &v);

} // namespace strata::exec
