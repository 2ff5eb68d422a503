//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the scope outlining pass.
//
// Phases per graph:
//   1. Split: a ScopeBoundaryTracker drives sequentialSplit() so that every
//      maximal top-level scope span becomes one child graph `submod_<n>`.
//   2. Reconcile: the caller's output signature is aligned with the split
//      graph and follows every later rename through the output rename hook.
//   3. Rewrite: each invoke whose body starts with scope.enter is replaced by
//      graph.ref + region; every other invoke is inlined back.
//   4. Prune, recurse into graph.ref children, verify.
//
// Tracing: set OutlineScopesConfig::trace or the STRATA_OUTLINE_TRACE
// environment variable to get one `[outline]` line per decision.
//
//===----------------------------------------------------------------------===//

#include "ir/transform/OutlineScopes.hpp"

#include "ir/transform/OutlineDiagnostics.hpp"
#include "ir/transform/ScopeBoundaryTracker.hpp"
#include "ir/transform/ScopeMarkers.hpp"
#include "ir/transform/SequentialSplit.hpp"
#include "ir/utils/GraphUtils.hpp"
#include "ir/verify/Verifier.hpp"

#include <cstdlib>
#include <iostream>
#include <set>
#include <string>
#include <unordered_map>

using namespace strata::core;

namespace strata::transform
{

namespace
{

constexpr const char *kRegionOpName = "scope_region";
constexpr const char *kRegionOpQualifiedName = "RegionOp.scope_region";

std::ostream *traceStream(const OutlineScopesConfig &config)
{
    if (config.trace)
        return config.trace;
    static const bool enabled = std::getenv("STRATA_OUTLINE_TRACE") != nullptr;
    return enabled ? &std::cerr : nullptr;
}

/// Map the body's scope parameters onto values of the parent graph.
support::Expected<std::vector<Value>> remapScopeParams(const Graph &body,
                                                       const Node &enter,
                                                       const std::vector<Value> &callArgs)
{
    std::unordered_map<NodeId, Value> argOf;
    size_t index = 0;
    for (const auto &n : body.nodes())
    {
        if (n.op != Opcode::Param)
            continue;
        if (index < callArgs.size())
            argOf[n.id] = callArgs[index];
        ++index;
    }

    std::vector<Value> params = enter.operands;
    std::string offending;
    for (auto &p : params)
    {
        rewriteRefs(p,
                    [&](NodeId id)
                    {
                        auto it = argOf.find(id);
                        if (it != argOf.end())
                            return it->second;
                        if (offending.empty())
                        {
                            const Node *n = body.find(id);
                            offending = n ? n->name : std::to_string(id);
                        }
                        return Value::none();
                    });
    }
    if (!offending.empty())
        return support::makeError(diag::kUnsupportedScopeParameter,
                                  {},
                                  "scope.enter '%" + enter.name + "' in '" + body.name() +
                                      "' takes body-local value '%" + offending + "' as a parameter");
    return params;
}

Meta regionMeta(const Meta &base, const Node &enter)
{
    Meta meta = base;
    meta.provenance = enter.meta.provenance;
    meta.origin = OriginTag{kRegionOpName, kRegionOpQualifiedName};
    return meta;
}

} // namespace

support::Expected<void> replaceWithRegion(Graph &parent, NodeId invokeId, OutlineStats *stats)
{
    const Node *call = parent.find(invokeId);
    if (!call || !isOutlinedScopeBody(parent, *call))
        return support::makeError("I4003", {}, "replaceWithRegion: node is not an invoke of a scope body");
    const std::string target = call->target;
    const std::vector<Value> callArgs = call->operands;

    // Work on a copy so the parent can be edited while the body is inspected.
    Graph body = *parent.subgraph(target);
    const auto markers = utils::filterNodes(body, isScopeMarker);
    if (markers.size() < 2)
        return support::makeError(diag::kIncompleteScopeBlock,
                                  {},
                                  "scope body '" + target + "' holds " + std::to_string(markers.size()) +
                                      " scope marker(s); a matching scope.enter and scope.exit are required");

    const Node enter = *body.find(markers.front());
    const Node exitNode = *body.find(markers.back());
    if (!isScopeExit(exitNode) || exitNode.operands.size() != 1 || !exitNode.operands.front().isRef() ||
        exitNode.operands.front().id != enter.id)
        return support::makeError(diag::kMalformedScopeNesting,
                                  {},
                                  "scope body '" + target + "' does not end with the scope.exit of '%" + enter.name +
                                      "'");

    for (NodeId userId : body.users(enter.id))
    {
        if (userId == exitNode.id)
            continue;
        return support::makeError(diag::kUnsupportedOutputShape,
                                  {},
                                  "scope handle '%" + enter.name + "' of '" + target + "' is read by '%" +
                                      body.find(userId)->name + "'");
    }

    auto scopeParams = remapScopeParams(body, enter, callArgs);
    if (!scopeParams)
        return scopeParams.error();

    Node *out = body.output();
    if (out)
    {
        // A scope.exit read after the scope stands for the value it carries.
        const Node *carried = scopeResultNode(body, exitNode);
        const Value passThrough = carried ? Value::ref(carried->id) : Value::none();
        for (auto &operand : out->operands)
            rewriteRefs(operand, [&](NodeId id) { return id == exitNode.id ? passThrough : Value::ref(id); });
    }

    if (!out)
    {
        if (auto r = parent.erase(invokeId); !r)
            return r;
        if (stats)
            ++stats->scopesDropped;
    }
    else
    {
        const Value result = out->operands.empty() ? Value::none() : out->operands.front();
        std::vector<Node> members;
        if (result.isList())
        {
            for (size_t i = 0; i < result.elems.size(); ++i)
            {
                const Value &e = result.elems[i];
                const Node *member = e.isRef() ? body.find(e.id) : nullptr;
                if (!member)
                    return support::makeError(diag::kUnsupportedOutputShape,
                                              {},
                                              "scope body '" + target + "' returns " + describeKind(e) +
                                                  " at tuple position " + std::to_string(i));
                members.push_back(*member);
            }
        }
        else if (const Node *member = result.isRef() ? body.find(result.id) : nullptr)
        {
            members.push_back(*member);
        }
        else
        {
            return support::makeError(diag::kUnsupportedOutputShape,
                                      {},
                                      "scope body '" + target + "' returns unsupported " + describeKind(result));
        }

        Node &ref = parent.insertBefore(invokeId, Opcode::GraphRef, target, {}, target);
        ref.meta.provenance = enter.meta.provenance;
        const NodeId refId = ref.id;

        std::vector<Value> operands;
        operands.reserve(callArgs.size() + 2);
        operands.push_back(Value::list(std::move(scopeParams.value())));
        operands.push_back(Value::ref(refId));
        operands.insert(operands.end(), callArgs.begin(), callArgs.end());

        Meta meta;
        std::string regionName = kRegionOpName;
        if (result.isList())
        {
            std::vector<Type> elems;
            for (const auto &m : members)
                elems.push_back(m.meta.val);
            meta.val = Type::tuple(std::move(elems));
        }
        else
        {
            meta = members.front().meta;
            regionName = members.front().name;
        }

        Node &region = parent.insertBefore(invokeId, Opcode::Region, "", std::move(operands), kRegionOpName);
        region.meta = regionMeta(meta, enter);
        const NodeId regionId = region.id;
        // Named once the invoke is gone so the names it held become free.
        if (auto r = utils::replaceNode(parent, invokeId, Value::ref(regionId)); !r)
            return r;
        parent.rename(refId, target);
        parent.rename(regionId, regionName);

        if (result.isList())
        {
            for (NodeId userId : parent.users(regionId))
            {
                Node *user = parent.find(userId);
                if (user->op != Opcode::GetItem || user->operands.size() != 2 ||
                    user->operands[1].kind != Value::Kind::ConstInt)
                    continue;
                const long long index = user->operands[1].i64;
                if (index < 0 || static_cast<size_t>(index) >= members.size())
                    return support::makeError(diag::kUnsupportedOutputShape,
                                              {},
                                              "getitem '%" + user->name + "' reads position " +
                                                  std::to_string(index) + " of a " +
                                                  std::to_string(members.size()) + "-tuple region");
                const Node &member = members[static_cast<size_t>(index)];
                parent.rename(userId, member.name);
                parent.find(userId)->meta = member.meta;
            }
        }
        if (stats)
            ++stats->regionsOutlined;
    }

    Graph *stored = parent.subgraph(target);
    if (Node *storedOut = stored->output())
        storedOut->operands = out->operands;
    if (auto r = stored->erase(exitNode.id); !r)
        return r;
    return stored->erase(enter.id);
}

namespace
{

support::Expected<Graph> splitAndRewrite(const Graph &graph,
                                         std::optional<OutputSignature> &signature,
                                         const OutlineScopesConfig &config,
                                         OutlineStats &stats,
                                         std::ostream *trace)
{
    ScopeBoundaryTracker tracker;
    std::optional<support::Diag> trackerError;
    auto split = sequentialSplit(graph,
                                 [&](const Node &n)
                                 {
                                     if (trackerError)
                                         return false;
                                     auto starts = tracker.startsNewSegment(n);
                                     if (!starts)
                                     {
                                         trackerError = starts.error();
                                         return false;
                                     }
                                     return starts.value();
                                 });
    if (trackerError)
        return *trackerError;
    if (!split)
        return split.error();
    Graph g = std::move(split.value());

    if (signature)
    {
        if (auto r = signature->reconcile(g); !r)
            return r.error();
    }

    {
        std::optional<ScopedOutputRenameHook> hook;
        if (signature)
            hook.emplace(g, signature->renameHook());

        for (NodeId id : g.nodeIds())
        {
            const Node *n = g.find(id);
            if (!n || n->op != Opcode::Invoke)
                continue;
            const std::string target = n->target;
            if (isOutlinedScopeBody(g, *n))
            {
                if (trace)
                    *trace << "[outline] " << g.name() << ": outlining scope body '" << target << "'\n";
                if (auto r = replaceWithRegion(g, id, &stats); !r)
                    return r.error();
            }
            else
            {
                if (trace)
                    *trace << "[outline] " << g.name() << ": inlining segment '" << target << "'\n";
                if (auto r = utils::inlineInvoke(g, id); !r)
                    return r.error();
                ++stats.segmentsInlined;
            }
        }
    }

    if (config.pruneUnusedSubgraphs)
    {
        const size_t pruned = g.pruneUnusedSubgraphs();
        if (trace && pruned)
            *trace << "[outline] " << g.name() << ": pruned " << pruned << " child graph(s)\n";
    }
    return g;
}

support::Expected<OutlineResult> outlineGraph(const Graph &graph,
                                              std::optional<OutputSignature> signature,
                                              const OutlineScopesConfig &config,
                                              std::ostream *trace)
{
    OutlineResult result{graph, std::move(signature), {}};
    if (hasScopeMarkers(graph))
    {
        auto rewritten = splitAndRewrite(graph, result.signature, config, result.stats, trace);
        if (!rewritten)
            return rewritten.error();
        result.graph = std::move(rewritten.value());
    }
    else if (trace)
    {
        *trace << "[outline] " << graph.name() << ": no scope markers\n";
    }

    if (config.recurse)
    {
        std::set<std::string> visited;
        for (const auto &n : result.graph.nodes())
        {
            if (n.op != Opcode::GraphRef || !visited.insert(n.target).second)
                continue;
            const Graph *child = result.graph.subgraph(n.target);
            if (!child)
                continue;
            auto sub = outlineGraph(*child, std::nullopt, config, trace);
            if (!sub)
                return sub.error();
            result.stats.regionsOutlined += sub.value().stats.regionsOutlined;
            result.stats.segmentsInlined += sub.value().stats.segmentsInlined;
            result.stats.scopesDropped += sub.value().stats.scopesDropped;
            result.graph.setSubgraph(std::move(sub.value().graph));
        }
    }
    return result;
}

} // namespace

support::Expected<OutlineResult> outlineScopes(const Graph &graph,
                                               std::optional<OutputSignature> signature,
                                               const OutlineScopesConfig &config)
{
    std::ostream *trace = traceStream(config);
    auto result = outlineGraph(graph, std::move(signature), config, trace);
    if (!result)
        return result.error();
    if (trace)
    {
        const auto &stats = result.value().stats;
        *trace << "[outline] done: " << stats.regionsOutlined << " region(s), " << stats.segmentsInlined
               << " inlined segment(s), " << stats.scopesDropped << " dropped scope(s)\n";
    }
    if (config.verify)
    {
        if (auto v = verify::Verifier::verify(result.value().graph); !v)
            return v.error();
    }
    return result;
}

} // namespace strata::transform
