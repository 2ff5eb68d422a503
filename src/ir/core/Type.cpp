// File: src/ir/core/Type.cpp
// Purpose: Implements construction and printing of result type descriptors.
// Key invariants: toString output is accepted by the graph text parser.
// Ownership/Lifetime: Value type.

#include "ir/core/Type.hpp"

#include <sstream>
#include <utility>

namespace strata::core
{

Type::Type(Kind k) : kind(k) {}

Type Type::tensor(std::string dtype, std::vector<long long> shape)
{
    Type t(Kind::Tensor);
    t.dtype = std::move(dtype);
    t.shape = std::move(shape);
    return t;
}

Type Type::tuple(std::vector<Type> elems)
{
    Type t(Kind::Tuple);
    t.elems = std::move(elems);
    return t;
}

std::string kindToString(Type::Kind k)
{
    switch (k)
    {
        case Type::Kind::None:
            return "none";
        case Type::Kind::I1:
            return "i1";
        case Type::Kind::I64:
            return "i64";
        case Type::Kind::F64:
            return "f64";
        case Type::Kind::Str:
            return "str";
        case Type::Kind::Unknown:
        case Type::Kind::Tensor:
        case Type::Kind::Tuple:
            return "";
    }
    return "";
}

std::string Type::toString() const
{
    std::ostringstream os;
    switch (kind)
    {
        case Kind::Unknown:
            return "?";
        case Kind::Tensor:
            os << dtype << '[';
            for (size_t i = 0; i < shape.size(); ++i)
            {
                if (i)
                    os << ',';
                os << shape[i];
            }
            os << ']';
            return os.str();
        case Kind::Tuple:
            os << '(';
            for (size_t i = 0; i < elems.size(); ++i)
            {
                if (i)
                    os << ", ";
                os << elems[i].toString();
            }
            os << ')';
            return os.str();
        default:
            return kindToString(kind);
    }
}

bool operator==(const Type &a, const Type &b)
{
    return a.kind == b.kind && a.dtype == b.dtype && a.shape == b.shape && a.elems == b.elems;
}

bool operator!=(const Type &a, const Type &b)
{
    return !(a == b);
}

} // namespace strata::core
