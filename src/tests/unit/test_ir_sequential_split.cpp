// File: src/tests/unit/test_ir_sequential_split.cpp
// Purpose: Verify segment assignment, live-in/live-out discovery and the
//          invoke chain produced by sequentialSplit.
// Key invariants: The input graph is never modified; the result verifies.

#include "ir/build/GraphBuilder.hpp"
#include "ir/io/Serializer.hpp"
#include "ir/transform/SequentialSplit.hpp"
#include "ir/verify/Verifier.hpp"

#include "ScopeGraphFixtures.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

using namespace strata::build;
using namespace strata::core;
using strata::testing::nodeNames;
using strata::testing::parseGraph;
using strata::transform::SegmentBoundaryFn;
using strata::transform::sequentialSplit;

namespace
{

SegmentBoundaryFn splitAt(std::set<std::string> names)
{
    return [names](const Node &n) { return names.count(n.name) != 0; };
}

/// main(x) { y = body(x); z = f(y); output z } with `body(p) = g(p)`.
Graph graphWithChild(const std::string &childName)
{
    Graph g;
    {
        GraphBuilder cb(GraphBuilder(g).subgraph(childName));
        auto p = cb.param("p");
        cb.output(cb.call("g", {p}));
    }
    GraphBuilder b(g);
    auto x = b.param("x");
    auto y = b.invoke(childName, {x}, "y");
    auto z = b.call("f", {y}, "z");
    b.output(z);
    return g;
}

} // namespace

TEST(SequentialSplit, ConsultsCallbackOncePerNode)
{
    const Graph g = parseGraph(strata::testing::kSingleScope);
    size_t calls = 0;
    auto r = sequentialSplit(g,
                             [&](const Node &)
                             {
                                 ++calls;
                                 return false;
                             });
    ASSERT_TRUE(r.hasValue());
    EXPECT_EQ(calls, g.nodes().size());
}

TEST(SequentialSplit, OutlinesThreeSegments)
{
    const Graph g = parseGraph(strata::testing::kSingleScope);
    const std::string before = strata::io::Serializer::toString(g);

    auto r = sequentialSplit(g, splitAt({"b", "e"}));
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    const Graph &top = r.value();

    EXPECT_EQ(nodeNames(top), "x submod_0 submod_1 submod_2 output");
    ASSERT_EQ(top.subgraphs().size(), 3u);

    const Graph *first = top.subgraph("submod_0");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(nodeNames(*first), "x a output");

    const Graph *body = top.subgraph("submod_1");
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(nodeNames(*body), "a b c d output");
    EXPECT_EQ(body->nodes().front().op, Opcode::Param);
    EXPECT_EQ(body->findByName("b")->meta.provenance.size(), 1u);

    const Node *inv = top.findByName("submod_1");
    ASSERT_EQ(inv->operands.size(), 1u);
    EXPECT_EQ(inv->operands[0], Value::ref(top.findByName("submod_0")->id));
    EXPECT_EQ(inv->meta.val, Type::tensor("f32", {4}));

    EXPECT_EQ(strata::io::Serializer::formatValue(top, top.output()->operands[0]), "(%submod_2)");
    EXPECT_TRUE(strata::verify::Verifier::verify(top).hasValue());
    EXPECT_EQ(strata::io::Serializer::toString(g), before);
}

TEST(SequentialSplit, UnpacksSeveralOutputsWithGetItem)
{
    const Graph g = parseGraph(strata::testing::kTupleScope);
    auto r = sequentialSplit(g, splitAt({"b", "e"}));
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    const Graph &top = r.value();

    // No node precedes the first boundary, so numbering starts at one.
    EXPECT_EQ(nodeNames(top), "x submod_1 getitem getitem_1 submod_2 output");
    EXPECT_EQ(top.subgraph("submod_0"), nullptr);

    const Node *first = top.findByName("getitem");
    const Node *second = top.findByName("getitem_1");
    EXPECT_EQ(first->operands[1], Value::constInt(0));
    EXPECT_EQ(second->operands[1], Value::constInt(1));
    EXPECT_EQ(first->meta.val, Type::tensor("f32", {4}));
    EXPECT_EQ(second->meta.val.kind, Type::Kind::I64);

    const Graph *body = top.subgraph("submod_1");
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(nodeNames(*body), "x b c d2 ex output");
    EXPECT_EQ(strata::io::Serializer::formatValue(*body, body->output()->operands[0]), "(%c, %d2)");

    const Node *tail = top.findByName("submod_2");
    ASSERT_EQ(tail->operands.size(), 2u);
    EXPECT_EQ(tail->operands[0], Value::ref(first->id));
    EXPECT_EQ(tail->operands[1], Value::ref(second->id));
    EXPECT_TRUE(strata::verify::Verifier::verify(top).hasValue());
}

TEST(SequentialSplit, CopiesReferencedChildGraphs)
{
    const Graph g = graphWithChild("body");
    auto r = sequentialSplit(g, splitAt({"z"}));
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    const Graph &top = r.value();

    ASSERT_NE(top.subgraph("body"), nullptr);
    const Graph *seg = top.subgraph("submod_0");
    ASSERT_NE(seg, nullptr);
    EXPECT_NE(seg->subgraph("body"), nullptr);
    EXPECT_EQ(nodeNames(*seg), "x y output");
    EXPECT_TRUE(strata::verify::Verifier::verify(top).hasValue());
}

TEST(SequentialSplit, AvoidsChildNameCollisions)
{
    const Graph g = graphWithChild("submod_0");
    auto r = sequentialSplit(g, splitAt({"z"}));
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    const Graph &top = r.value();

    EXPECT_EQ(nodeNames(top), "x submod_0_1 submod_1 output");
    const Graph *seg = top.subgraph("submod_0_1");
    ASSERT_NE(seg, nullptr);
    EXPECT_EQ(seg->findByName("y")->target, "submod_0");
    EXPECT_NE(seg->subgraph("submod_0"), nullptr);
    EXPECT_TRUE(strata::verify::Verifier::verify(top).hasValue());
}

TEST(SequentialSplit, RejectsForwardReferences)
{
    Graph g;
    GraphBuilder b(g);
    auto x = b.param("x");
    auto a = b.call("f", {x}, "a");
    auto c = b.call("g", {x}, "c");
    b.node(a).operands = {c};

    auto r = sequentialSplit(g, splitAt({"c"}));
    ASSERT_FALSE(r.hasValue());
    EXPECT_EQ(r.error().code, "I4006");
}
