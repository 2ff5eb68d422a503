// File: src/tests/unit/test_ir_graph_core.cpp
// Purpose: Exercise the host mutation API of Graph.
// Key invariants: Names stay unique; nodes with users cannot be erased; the
//                 output rename hook sees every change to output operands.

#include "ir/core/Graph.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace strata::core;

namespace
{

using RenameLog = std::vector<std::pair<std::string, std::string>>;

Graph::OutputRenameHook recordInto(RenameLog &log)
{
    return [&log](const std::string &oldName, const std::string &newName) { log.emplace_back(oldName, newName); };
}

} // namespace

TEST(GraphCore, UniqueNamesGetNumericSuffixes)
{
    Graph g;
    EXPECT_EQ(g.append(Opcode::Call, "f", {}, "a").name, "a");
    EXPECT_EQ(g.append(Opcode::Call, "f", {}, "a").name, "a_1");
    EXPECT_EQ(g.append(Opcode::Call, "f", {}, "a").name, "a_2");
    EXPECT_EQ(g.append(Opcode::Call, "f", {}, "").name, "node");
    EXPECT_EQ(g.uniqueName("a"), "a_3");
}

TEST(GraphCore, AppendKeepsOutputLast)
{
    Graph g;
    const NodeId a = g.append(Opcode::Call, "f", {}, "a").id;
    g.append(Opcode::Output, "", {Value::ref(a)}, "");
    const NodeId b = g.append(Opcode::Call, "g", {}, "b").id;

    ASSERT_NE(g.output(), nullptr);
    EXPECT_EQ(g.output()->name, "output");
    EXPECT_EQ(g.indexOf(b), 1);
    EXPECT_EQ(g.nodes().back().op, Opcode::Output);
}

TEST(GraphCore, InsertBeforeUnknownAnchorThrows)
{
    Graph g;
    EXPECT_THROW(g.insertBefore(42, Opcode::Call, "f", {}, "a"), std::logic_error);
}

TEST(GraphCore, EraseIsRefusedWhileUsed)
{
    Graph g;
    const NodeId a = g.append(Opcode::Call, "f", {}, "a").id;
    const NodeId b = g.append(Opcode::Call, "g", {Value::list({Value::ref(a)})}, "b").id;

    auto refused = g.erase(a);
    ASSERT_FALSE(refused.hasValue());
    EXPECT_EQ(refused.error().code, "I4002");
    EXPECT_NE(refused.error().message.find("%b"), std::string::npos);

    EXPECT_TRUE(g.erase(b).hasValue());
    EXPECT_TRUE(g.erase(a).hasValue());
    EXPECT_TRUE(g.nodes().empty());

    auto unknown = g.erase(a);
    ASSERT_FALSE(unknown.hasValue());
    EXPECT_EQ(unknown.error().code, "I4001");
}

TEST(GraphCore, NodeIdsAreNeverReused)
{
    Graph g;
    const NodeId a = g.append(Opcode::Call, "f", {}, "a").id;
    ASSERT_TRUE(g.erase(a).hasValue());
    const NodeId b = g.append(Opcode::Call, "f", {}, "a").id;
    EXPECT_NE(a, b);
    EXPECT_EQ(g.find(a), nullptr);
}

TEST(GraphCore, ReplaceAllUsesRewritesNestedListsAndNotifiesHook)
{
    Graph g;
    const NodeId a = g.append(Opcode::Call, "f", {}, "a").id;
    const NodeId b = g.append(Opcode::Call, "g", {}, "b").id;
    const NodeId c = g.append(Opcode::Call, "h", {}, "c").id;
    const NodeId d = g.append(Opcode::Call, "k", {Value::list({Value::ref(a), Value::constInt(1)})}, "d").id;
    g.append(Opcode::Output, "", {Value::list({Value::ref(a), Value::ref(b)})}, "");

    RenameLog log;
    ScopedOutputRenameHook hook(g, recordInto(log));
    g.replaceAllUsesWith(a, Value::ref(c));

    EXPECT_TRUE(g.users(a).empty());
    EXPECT_EQ(g.find(d)->operands.front().elems.front(), Value::ref(c));
    EXPECT_EQ(g.output()->operands.front().elems.front(), Value::ref(c));
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.front(), std::make_pair(std::string("a"), std::string("c")));
}

TEST(GraphCore, ReplaceOutsideOutputDoesNotNotify)
{
    Graph g;
    const NodeId a = g.append(Opcode::Call, "f", {}, "a").id;
    const NodeId b = g.append(Opcode::Call, "g", {}, "b").id;
    g.append(Opcode::Call, "h", {Value::ref(a)}, "c");
    g.append(Opcode::Output, "", {Value::ref(b)}, "");

    RenameLog log;
    ScopedOutputRenameHook hook(g, recordInto(log));
    g.replaceAllUsesWith(a, Value::ref(b));
    EXPECT_TRUE(log.empty());
}

TEST(GraphCore, RenameAllocatesUniqueNameAndNotifiesForOutputs)
{
    Graph g;
    const NodeId a = g.append(Opcode::Call, "f", {}, "a").id;
    const NodeId b = g.append(Opcode::Call, "g", {}, "b").id;
    g.append(Opcode::Output, "", {Value::list({Value::ref(b)})}, "");

    RenameLog log;
    ScopedOutputRenameHook hook(g, recordInto(log));
    EXPECT_EQ(g.rename(a, "z"), "z");
    EXPECT_TRUE(log.empty());

    EXPECT_EQ(g.rename(b, "z"), "z_1");
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.front(), std::make_pair(std::string("b"), std::string("z_1")));

    EXPECT_EQ(g.rename(b, "z_1"), "z_1");
    EXPECT_EQ(log.size(), 1u);
}

TEST(GraphCore, ScopedHookRestoresPreviousHook)
{
    Graph g;
    const NodeId a = g.append(Opcode::Call, "f", {}, "a").id;
    g.append(Opcode::Output, "", {Value::ref(a)}, "");

    RenameLog outer;
    RenameLog inner;
    g.setOutputRenameHook(recordInto(outer));
    {
        ScopedOutputRenameHook hook(g, recordInto(inner));
        g.rename(a, "b");
    }
    g.rename(a, "c");

    ASSERT_EQ(inner.size(), 1u);
    ASSERT_EQ(outer.size(), 1u);
    EXPECT_EQ(outer.front().second, "c");
    g.setOutputRenameHook(nullptr);
}

TEST(GraphCore, PruneDeletesOnlyUnreferencedChildren)
{
    Graph g;
    g.setSubgraph(Graph("used"));
    g.setSubgraph(Graph("called"));
    g.setSubgraph(Graph("unused"));
    g.append(Opcode::GraphRef, "used", {}, "used");
    g.append(Opcode::Invoke, "called", {}, "called");

    EXPECT_EQ(g.pruneUnusedSubgraphs(), 1u);
    EXPECT_NE(g.subgraph("used"), nullptr);
    EXPECT_NE(g.subgraph("called"), nullptr);
    EXPECT_EQ(g.subgraph("unused"), nullptr);
}

TEST(GraphCore, SubgraphNamesAreUnique)
{
    Graph g;
    g.setSubgraph(Graph("submod_0"));
    EXPECT_EQ(g.uniqueSubgraphName("submod_0"), "submod_0_1");
    EXPECT_EQ(g.uniqueSubgraphName("submod_1"), "submod_1");

    Graph replacement("submod_0");
    replacement.append(Opcode::Param, "", {}, "p");
    g.setSubgraph(std::move(replacement));
    ASSERT_EQ(g.subgraphs().size(), 1u);
    EXPECT_EQ(g.subgraph("submod_0")->nodes().size(), 1u);
    EXPECT_TRUE(g.eraseSubgraph("submod_0"));
    EXPECT_FALSE(g.eraseSubgraph("submod_0"));
}

TEST(GraphCore, CopiesAreDeep)
{
    Graph g;
    Graph child("body");
    child.append(Opcode::Param, "", {}, "p");
    g.setSubgraph(std::move(child));

    Graph copy = g;
    copy.subgraph("body")->append(Opcode::Param, "", {}, "q");
    EXPECT_EQ(g.subgraph("body")->nodes().size(), 1u);
    EXPECT_EQ(copy.subgraph("body")->nodes().size(), 2u);
}
