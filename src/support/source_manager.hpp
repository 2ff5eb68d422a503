//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares the registry mapping file identifiers to paths.
// Key invariants: File id 0 is invalid.
// Ownership/Lifetime: Owns stored file path strings.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace strata::support
{

/// Maintains the mapping between numeric file identifiers and their
/// corresponding filesystem paths. Clients register graph files and look up
/// paths by identifier when printing diagnostics.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @param path File system path.
    /// @return New file identifier (>0 on success, 0 on overflow).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id.
    /// @param file_id Identifier returned by addFile().
    /// @return File path string view, empty when unknown.
    std::string_view getPath(uint32_t file_id) const;

  private:
    /// Stored file paths; std::deque keeps string references stable.
    std::deque<std::string> files_;

    /// Next identifier to assign; stored as 64-bit to detect overflow safely.
    uint64_t next_file_id_ = 1;

    /// Lookup from normalized path to previously assigned identifier.
    std::unordered_map<std::string, uint32_t> path_to_id_;
};

} // namespace strata::support
