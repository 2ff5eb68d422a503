//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares the scope outlining pass. The pass rewrites every top-level
// scope.enter .. scope.exit span of a graph into a single `region` node that
// runs an outlined child graph under the scope's parameters:
//
//   %b = scope.enter("cuda", "f16")          %submod_1 = graph.ref submod_1
//   %c = call g(%a)                   ==>    %c = region(("cuda", "f16"), %submod_1, %a)
//   %d = scope.exit(%b)
//
// The rewrite splits the graph into segments with sequentialSplit(), replaces
// the invocation of each segment that starts with a scope by a region node
// and inlines every other segment back in place. Nested scopes end up inside
// the outlined bodies and are handled by recursing into referenced children.
//
// Errors abort the pass and are reported through Expected with the codes in
// OutlineDiagnostics.hpp; the input graph is never modified.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Graph.hpp"
#include "ir/transform/OutputSignature.hpp"
#include "support/diag_expected.hpp"

#include <optional>
#include <ostream>

namespace strata::transform
{

/// @brief Knobs of the scope outlining pass.
struct OutlineScopesConfig
{
    /// Rewrite child graphs referenced by graph.ref nodes as well.
    bool recurse = true;
    /// Run the structural verifier on the result.
    bool verify = true;
    /// Delete child graphs no longer referenced after rewriting.
    bool pruneUnusedSubgraphs = true;
    /// Trace destination; when null STRATA_OUTLINE_TRACE selects std::cerr.
    std::ostream *trace = nullptr;
};

/// @brief Counters describing what a run of the pass did.
struct OutlineStats
{
    unsigned regionsOutlined = 0;
    unsigned segmentsInlined = 0;
    unsigned scopesDropped = 0;
};

/// @brief Rewritten graph plus the reconciled output signature, if any.
struct OutlineResult
{
    core::Graph graph;
    std::optional<OutputSignature> signature;
    OutlineStats stats;
};

/// @brief Outline the scopes of @p graph (and, by default, of its children).
/// @param graph Graph to rewrite; left untouched.
/// @param signature Optional externally visible output naming kept in sync.
/// @param config Pass configuration.
support::Expected<OutlineResult> outlineScopes(const core::Graph &graph,
                                               std::optional<OutputSignature> signature = std::nullopt,
                                               const OutlineScopesConfig &config = {});

/// @brief Replace invoke @p invokeId of an outlined scope body by a region node.
/// @details Erases the call without replacement when the body has no output.
support::Expected<void> replaceWithRegion(core::Graph &parent, core::NodeId invokeId, OutlineStats *stats = nullptr);

} // namespace strata::transform
