//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Value struct, which represents node operands in the
// graph IR. Values are tagged unions that hold a reference to another node of
// the same graph, a literal constant, the None constant, or a list of nested
// values.
//
// Supported Value Kinds:
// - NodeRef: reference to a node by id (%name in the textual form)
// - ConstInt: integer literal; booleans reuse it with the isBool flag
// - ConstFloat: floating-point literal
// - ConstStr: string literal
// - None: the absent value
// - List: ordered sequence of values, used for tuples of outputs and for
//   scope parameters
//
// Node references are ids, never pointers. Ids are stable for the lifetime of
// the owning graph and are never reused after a node is erased, so a stale
// reference can be detected by the verifier rather than silently aliasing a
// new node.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <vector>

namespace strata::core
{

/// @brief Identifier of a node, unique within its owning graph.
using NodeId = unsigned;

/// @brief Tagged value used as node operands.
struct Value
{
    /// @brief Enumerates the different value forms.
    enum class Kind
    {
        NodeRef,
        ConstInt,
        ConstFloat,
        ConstStr,
        None,
        List
    };

    /// Discriminant selecting which payload is active.
    Kind kind = Kind::None;
    /// Integer payload used when kind == Kind::ConstInt.
    long long i64{0};
    /// Floating-point payload used when kind == Kind::ConstFloat.
    double f64{0.0};
    /// Referenced node used when kind == Kind::NodeRef.
    NodeId id{0};
    /// String payload for string constants.
    std::string str;
    /// Nested values used when kind == Kind::List.
    std::vector<Value> elems;

    /// @brief Flag set when the integer literal represents a boolean.
    /// @invariant Only meaningful when kind == Kind::ConstInt.
    bool isBool{false};

    /// @brief Construct a reference to node @p id.
    static Value ref(NodeId id);

    /// @brief Construct an integer constant value.
    static Value constInt(long long v);

    /// @brief Construct a boolean constant value.
    static Value constBool(bool v);

    /// @brief Construct a floating-point constant value.
    static Value constFloat(double v);

    /// @brief Construct a string constant value.
    static Value constStr(std::string s);

    /// @brief Construct the None constant.
    static Value none();

    /// @brief Construct a list of values.
    static Value list(std::vector<Value> elems);

    [[nodiscard]] bool isRef() const
    {
        return kind == Kind::NodeRef;
    }

    [[nodiscard]] bool isList() const
    {
        return kind == Kind::List;
    }

    [[nodiscard]] bool isNone() const
    {
        return kind == Kind::None;
    }
};

bool operator==(const Value &a, const Value &b);
bool operator!=(const Value &a, const Value &b);

/// @brief Describe the shape of @p v in words ("node reference", "list", ...).
std::string describeKind(const Value &v);

/// @brief Invoke @p fn on every node reference nested anywhere in @p v.
template <typename Fn> void forEachRef(const Value &v, Fn &&fn)
{
    if (v.kind == Value::Kind::NodeRef)
    {
        fn(v.id);
        return;
    }
    if (v.kind == Value::Kind::List)
    {
        for (const auto &e : v.elems)
            forEachRef(e, fn);
    }
}

/// @brief Replace every nested node reference using @p fn.
/// @details @p fn maps a referenced id to the value that should stand in its
///          place; it may return a constant or a reference to another node.
template <typename Fn> void rewriteRefs(Value &v, Fn &&fn)
{
    if (v.kind == Value::Kind::NodeRef)
    {
        v = fn(v.id);
        return;
    }
    if (v.kind == Value::Kind::List)
    {
        for (auto &e : v.elems)
            rewriteRefs(e, fn);
    }
}

} // namespace strata::core
