//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "ir/exec/RtValue.hpp"

#include <sstream>
#include <utility>

namespace strata::exec
{

RtValue RtValue::none()
{
    return RtValue{};
}

RtValue RtValue::integer(long long v)
{
    RtValue r;
    r.kind = Kind::Int;
    r.i64 = v;
    return r;
}

RtValue RtValue::boolean(bool v)
{
    RtValue r;
    r.kind = Kind::Bool;
    r.i64 = v ? 1 : 0;
    return r;
}

RtValue RtValue::real(double v)
{
    RtValue r;
    r.kind = Kind::Float;
    r.f64 = v;
    return r;
}

RtValue RtValue::string(std::string s)
{
    RtValue r;
    r.kind = Kind::Str;
    r.str = std::move(s);
    return r;
}

RtValue RtValue::tuple(std::vector<RtValue> elems)
{
    RtValue r;
    r.kind = Kind::Tuple;
    r.elems = std::move(elems);
    return r;
}

RtValue RtValue::scope(long long depth)
{
    RtValue r;
    r.kind = Kind::Scope;
    r.i64 = depth;
    return r;
}

RtValue RtValue::graph(std::string name)
{
    RtValue r;
    r.kind = Kind::Graph;
    r.str = std::move(name);
    return r;
}

bool operator==(const RtValue &a, const RtValue &b)
{
    if (a.kind != b.kind)
        return false;
    switch (a.kind)
    {
        case RtValue::Kind::None:
            return true;
        case RtValue::Kind::Int:
        case RtValue::Kind::Bool:
        case RtValue::Kind::Scope:
            return a.i64 == b.i64;
        case RtValue::Kind::Float:
            return a.f64 == b.f64;
        case RtValue::Kind::Str:
        case RtValue::Kind::Graph:
            return a.str == b.str;
        case RtValue::Kind::Tuple:
            return a.elems == b.elems;
    }
    return false;
}

bool operator!=(const RtValue &a, const RtValue &b)
{
    return !(a == b);
}

std::string toString(const RtValue &v)
{
    std::ostringstream os;
    switch (v.kind)
    {
        case RtValue::Kind::None:
            return "none";
        case RtValue::Kind::Int:
            return std::to_string(v.i64);
        case RtValue::Kind::Bool:
            return v.i64 ? "true" : "false";
        case RtValue::Kind::Float:
            os << v.f64;
            return os.str();
        case RtValue::Kind::Str:
            return "\"" + v.str + "\"";
        case RtValue::Kind::Tuple:
            os << '(';
            for (size_t i = 0; i < v.elems.size(); ++i)
                os << (i ? ", " : "") << toString(v.elems[i]);
            os << ')';
            return os.str();
        case RtValue::Kind::Scope:
            return "<scope " + std::to_string(v.i64) + ">";
        case RtValue::Kind::Graph:
            return "<graph " + v.str + ">";
    }
    return "?";
}

} // namespace strata::exec
