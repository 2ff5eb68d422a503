//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager utility responsible for tracking graph files
// referenced by diagnostics. The manager assigns stable numeric identifiers to
// file paths and resolves those identifiers back to normalized strings when
// printing diagnostics.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include "support/diag_expected.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace strata::support
{
namespace
{
std::string normalizePath(std::string path)
{
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}
} // namespace

/// @brief Register a file path and assign it a stable identifier.
///
/// @details Identifiers start at one, leaving zero to represent an unknown
///          location. Registering the same normalized path twice returns the
///          identifier handed out the first time.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));
    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;
    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        auto diag = makeError({}, "source manager exhausted file identifier space");
        printDiag(diag, std::cerr);
        return 0;
    }
    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}

} // namespace strata::support
