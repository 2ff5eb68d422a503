// File: src/tests/unit/test_ir_graph_utils.cpp
// Purpose: Cover node filtering, replacement and invoke inlining.
// Key invariants: Inlining preserves body order, keeps free names and rewires
//                 single results and getitem projections.

#include "ir/build/GraphBuilder.hpp"
#include "ir/utils/GraphUtils.hpp"
#include "ir/verify/Verifier.hpp"

#include "ScopeGraphFixtures.hpp"

#include <gtest/gtest.h>

using namespace strata::build;
using namespace strata::core;
using strata::testing::nodeNames;

namespace
{

/// Child `body(p) = (f(p), k(p))` or `body(p) = f(p)`.
void addBody(Graph &g, bool twoResults)
{
    GraphBuilder cb(GraphBuilder(g).subgraph("body"));
    auto p = cb.param("p");
    auto q = cb.call("f", {p}, "q", Type::tensor("f32", {4}));
    if (twoResults)
    {
        auto w = cb.call("k", {p}, "w");
        cb.output(Value::list({q, w}));
    }
    else
    {
        cb.output(q);
    }
}

} // namespace

TEST(GraphUtils, FilterAndFirstFollowProgramOrder)
{
    Graph g;
    GraphBuilder b(g);
    auto x = b.param("x");
    b.call("f", {x}, "a");
    b.call("g", {x}, "b");
    b.call("f", {x}, "c");

    auto isF = [](const Node &n) { return n.op == Opcode::Call && n.target == "f"; };
    const auto ids = strata::utils::filterNodes(g, isF);
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(g.find(ids[0])->name, "a");
    EXPECT_EQ(g.find(ids[1])->name, "c");
    ASSERT_NE(strata::utils::firstNode(g, isF), nullptr);
    EXPECT_EQ(strata::utils::firstNode(g, isF)->name, "a");
    EXPECT_EQ(strata::utils::firstNode(g, [](const Node &n) { return n.op == Opcode::Region; }), nullptr);
}

TEST(GraphUtils, ReplaceNodeRedirectsUsesAndErases)
{
    Graph g;
    GraphBuilder b(g);
    auto x = b.param("x");
    auto a = b.call("f", {x}, "a");
    auto c = b.call("g", {a}, "c");
    b.output(c);

    ASSERT_TRUE(strata::utils::replaceNode(g, a.id, x).hasValue());
    EXPECT_EQ(nodeNames(g), "x c output");
    EXPECT_EQ(g.find(c.id)->operands.front(), x);
}

TEST(GraphUtils, InlinesSingleResult)
{
    Graph g;
    addBody(g, false);
    GraphBuilder b(g);
    auto x = b.param("x");
    auto r = b.invoke("body", {x});
    auto s = b.call("g", {r}, "s");
    b.output(s);

    ASSERT_TRUE(strata::utils::inlineInvoke(g, r.id).hasValue());
    EXPECT_EQ(nodeNames(g), "x q s output");
    const Node *q = g.findByName("q");
    ASSERT_NE(q, nullptr);
    EXPECT_EQ(q->operands.front(), x);
    EXPECT_EQ(q->meta.val.toString(), "f32[4]");
    EXPECT_EQ(g.find(s.id)->operands.front(), Value::ref(q->id));
    EXPECT_NE(g.subgraph("body"), nullptr);
}

TEST(GraphUtils, InlinesGetItemProjections)
{
    Graph g;
    addBody(g, true);
    GraphBuilder b(g);
    auto x = b.param("x");
    auto r = b.invoke("body", {x});
    auto g0 = b.getItem(r, 0, "g0");
    auto g1 = b.getItem(r, 1, "g1");
    auto h = b.call("h", {g1, g0}, "h");
    b.output(h);

    ASSERT_TRUE(strata::utils::inlineInvoke(g, r.id).hasValue());
    EXPECT_EQ(nodeNames(g), "x q w h output");
    const Node *call = g.find(h.id);
    EXPECT_EQ(call->operands[0], Value::ref(g.findByName("w")->id));
    EXPECT_EQ(call->operands[1], Value::ref(g.findByName("q")->id));
    EXPECT_TRUE(strata::verify::Verifier::verify(g).hasValue());
}

TEST(GraphUtils, InlinedCopiesAvoidTakenNames)
{
    Graph g;
    addBody(g, false);
    GraphBuilder b(g);
    auto x = b.param("x");
    b.call("z", {x}, "q");
    auto r = b.invoke("body", {x});
    b.output(r);

    ASSERT_TRUE(strata::utils::inlineInvoke(g, r.id).hasValue());
    EXPECT_EQ(nodeNames(g), "x q q_1 output");
    EXPECT_EQ(g.output()->operands.front(), Value::ref(g.findByName("q_1")->id));
}

TEST(GraphUtils, InlineWithoutOutputDropsCall)
{
    Graph g;
    {
        GraphBuilder cb(GraphBuilder(g).subgraph("body"));
        auto p = cb.param("p");
        cb.call("sink", {p}, "s");
    }
    GraphBuilder b(g);
    auto x = b.param("x");
    auto r = b.invoke("body", {x});
    b.output(x);

    ASSERT_TRUE(strata::utils::inlineInvoke(g, r.id).hasValue());
    EXPECT_EQ(nodeNames(g), "x s output");
}

TEST(GraphUtils, InlineReportsMissingArguments)
{
    Graph g;
    addBody(g, false);
    GraphBuilder b(g);
    auto r = b.invoke("body", {});
    b.output(r);

    auto result = strata::utils::inlineInvoke(g, r.id);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().code, "I4005");
}

TEST(GraphUtils, InlineRejectsNonInvoke)
{
    Graph g;
    GraphBuilder b(g);
    auto x = b.param("x");
    auto missing = b.invoke("nowhere", {x});

    auto notInvoke = strata::utils::inlineInvoke(g, x.id);
    ASSERT_FALSE(notInvoke.hasValue());
    EXPECT_EQ(notInvoke.error().code, "I4003");

    auto noChild = strata::utils::inlineInvoke(g, missing.id);
    ASSERT_FALSE(noChild.hasValue());
    EXPECT_EQ(noChild.error().code, "I4004");
}
