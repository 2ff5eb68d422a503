//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares OutputSignature, the externally visible naming of a graph's
// outputs. Each entry binds a declared output name to the name of the node that
// currently produces it, or to nothing for an output that is constantly None.
// Rewriting passes rename and replace nodes; the signature follows those
// changes through the graph's output rename hook so that callers keep finding
// their outputs under the declared names.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Graph.hpp"
#include "support/diag_expected.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::transform
{

/// @brief One declared output and the node name currently bound to it.
struct OutputSpec
{
    std::string declaredName;
    /// Absent for an output that is the None constant.
    std::optional<std::string> valueName;
};

class OutputSignature
{
  public:
    OutputSignature() = default;

    explicit OutputSignature(std::vector<OutputSpec> specs);

    /// @brief Derive a signature naming each output of @p g after its node.
    static OutputSignature fromGraph(const core::Graph &g, const std::vector<std::string> &declaredNames);

    [[nodiscard]] const std::vector<OutputSpec> &specs() const
    {
        return specs_;
    }

    void add(std::string declaredName, std::optional<std::string> valueName);

    /// @brief Look up the entry declared as @p declaredName.
    [[nodiscard]] const OutputSpec *find(std::string_view declaredName) const;

    /// @brief Rebind every entry bound to @p oldName to @p newName.
    void replaceAllUses(const std::string &oldName, const std::string &newName);

    /// @brief Align value names with the output node of @p g.
    /// @return S1004 when the entry count differs from the number of outputs,
    ///         when a None output is declared with a value, or when a declared
    ///         None output is produced by a node.
    support::Expected<void> reconcile(const core::Graph &g);

    /// @brief Hook forwarding graph output renames to replaceAllUses().
    /// @note The hook refers to this signature, which must outlive it.
    core::Graph::OutputRenameHook renameHook();

  private:
    std::vector<OutputSpec> specs_;
};

/// @brief Flatten the value returned by @p g's output node into its outputs.
/// @details A list yields its elements, any other value yields itself and a
///          graph without output yields nothing.
std::vector<core::Value> outputValues(const core::Graph &g);

} // namespace strata::transform
