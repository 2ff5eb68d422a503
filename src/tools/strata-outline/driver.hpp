//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares the routines powering the standalone `strata-outline` CLI. The
// entry point is factored into a separate unit so tests can run the tool
// against in-memory streams and a preconfigured SourceManager.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/options.hpp"
#include "support/source_manager.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::tools::outline
{

/// @brief Settings gathered from the command line.
struct OutlineToolOptions
{
    support::Options common;
    bool recurse = true;
    /// Declared output names; when set the reconciled signature is printed.
    std::optional<std::vector<std::string>> outputs;
};

/// @brief Parse, outline and print the graph stored at @p path.
/// @param out Stream receiving the rewritten graph.
/// @param err Stream receiving diagnostics and trace lines.
/// @return True when every stage succeeds.
bool runOutlinePipeline(std::string_view path,
                        const OutlineToolOptions &opts,
                        std::ostream &out,
                        std::ostream &err,
                        support::SourceManager &sm);

/// @brief Command-line entry point: `strata-outline [options] <file.sg>`.
/// @return 0 on success, 1 on usage, I/O, parse or pass errors.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err, support::SourceManager &sm);

} // namespace strata::tools::outline
