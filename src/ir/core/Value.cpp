//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the factory helpers and comparison for graph IR values.
//
//===----------------------------------------------------------------------===//

#include "ir/core/Value.hpp"

#include <utility>

namespace strata::core
{

Value Value::ref(NodeId id)
{
    Value v;
    v.kind = Kind::NodeRef;
    v.id = id;
    return v;
}

Value Value::constInt(long long v)
{
    Value out;
    out.kind = Kind::ConstInt;
    out.i64 = v;
    return out;
}

/// @brief Create a boolean literal backed by the integer constant encoding.
/// @details Booleans piggy-back on the integer representation but set the
///          @ref Value::isBool flag so printers render `true` / `false`.
Value Value::constBool(bool v)
{
    Value out = constInt(v ? 1 : 0);
    out.isBool = true;
    return out;
}

Value Value::constFloat(double v)
{
    Value out;
    out.kind = Kind::ConstFloat;
    out.f64 = v;
    return out;
}

Value Value::constStr(std::string s)
{
    Value out;
    out.kind = Kind::ConstStr;
    out.str = std::move(s);
    return out;
}

Value Value::none()
{
    return Value{};
}

Value Value::list(std::vector<Value> elems)
{
    Value out;
    out.kind = Kind::List;
    out.elems = std::move(elems);
    return out;
}

bool operator==(const Value &a, const Value &b)
{
    if (a.kind != b.kind)
        return false;
    switch (a.kind)
    {
        case Value::Kind::NodeRef:
            return a.id == b.id;
        case Value::Kind::ConstInt:
            return a.i64 == b.i64 && a.isBool == b.isBool;
        case Value::Kind::ConstFloat:
            return a.f64 == b.f64;
        case Value::Kind::ConstStr:
            return a.str == b.str;
        case Value::Kind::None:
            return true;
        case Value::Kind::List:
            return a.elems == b.elems;
    }
    return false;
}

bool operator!=(const Value &a, const Value &b)
{
    return !(a == b);
}

std::string describeKind(const Value &v)
{
    switch (v.kind)
    {
        case Value::Kind::NodeRef:
            return "node reference";
        case Value::Kind::ConstInt:
            return v.isBool ? "bool constant" : "int constant";
        case Value::Kind::ConstFloat:
            return "float constant";
        case Value::Kind::ConstStr:
            return "string constant";
        case Value::Kind::None:
            return "none";
        case Value::Kind::List:
            return "list";
    }
    return "unknown";
}

} // namespace strata::core
