//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the auxiliary metadata carried by every graph node. The
// rewriting passes never interpret metadata; they only move it around so that
// type information and source provenance survive restructuring.
//
// Fields:
// - val: static result type/shape of the node
// - provenance: ordered (key, path) frames naming the source scopes the node
//   was traced from, outermost first
// - origin: optional tag naming the operation that synthesised the node
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Type.hpp"

#include <optional>
#include <string>
#include <vector>

namespace strata::core
{

/// @brief One level of the source scope stack a node was traced from.
struct ScopeFrame
{
    std::string key;  ///< Stable identifier of the scope
    std::string path; ///< Human-readable qualified path of the scope

    bool operator==(const ScopeFrame &other) const
    {
        return key == other.key && path == other.path;
    }
};

/// @brief Name of the operation that produced a synthesised node.
struct OriginTag
{
    std::string name;          ///< Short operation name
    std::string qualifiedName; ///< Fully qualified operation name

    bool operator==(const OriginTag &other) const
    {
        return name == other.name && qualifiedName == other.qualifiedName;
    }
};

/// @brief Metadata dictionary attached to a node.
struct Meta
{
    Type val{};
    std::vector<ScopeFrame> provenance;
    std::optional<OriginTag> origin;

    bool operator==(const Meta &other) const
    {
        return val == other.val && provenance == other.provenance && origin == other.origin;
    }
};

} // namespace strata::core
