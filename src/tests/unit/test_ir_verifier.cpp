// File: src/tests/unit/test_ir_verifier.cpp
// Purpose: Check that each structural rule of the verifier is enforced.
// Key invariants: The first violation is reported with its V20xx code.

#include "ir/build/GraphBuilder.hpp"
#include "ir/verify/Verifier.hpp"

#include "ScopeGraphFixtures.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace strata::build;
using namespace strata::core;
using strata::verify::Verifier;

namespace
{

std::string failureCode(const Graph &g)
{
    auto r = Verifier::verify(g);
    return r.hasValue() ? std::string("ok") : r.error().code;
}

/// Child graph `name` taking @p params parameters and returning a list of
/// @p results values (a single value when @p results is 1).
void addChild(Graph &g, const std::string &name, int params, int results)
{
    GraphBuilder cb(GraphBuilder(g).subgraph(name));
    std::vector<Value> ps;
    for (int i = 0; i < params; ++i)
        ps.push_back(cb.param("p" + std::to_string(i)));
    std::vector<Value> outs;
    for (int i = 0; i < results; ++i)
        outs.push_back(cb.call("f", ps));
    if (results == 1)
        cb.output(outs.front());
    else if (results > 1)
        cb.output(Value::list(outs));
}

} // namespace

TEST(GraphVerifier, AcceptsFixtures)
{
    EXPECT_EQ(failureCode(strata::testing::parseGraph(strata::testing::kSingleScope)), "ok");
    EXPECT_EQ(failureCode(strata::testing::parseGraph(strata::testing::kNestedScopes)), "ok");
}

TEST(GraphVerifier, RejectsDuplicateNames)
{
    Graph g;
    GraphBuilder b(g);
    b.param("x");
    auto y = b.param("y");
    b.node(y).name = "x";
    EXPECT_EQ(failureCode(g), "V2001");
}

TEST(GraphVerifier, RejectsDanglingAndForwardReferences)
{
    Graph g;
    GraphBuilder b(g);
    auto a = b.call("f", {}, "a");
    auto c = b.call("g", {}, "c");
    b.node(a).operands = {c};
    EXPECT_EQ(failureCode(g), "V2003");

    b.node(a).operands = {Value::list({Value::ref(999)})};
    EXPECT_EQ(failureCode(g), "V2002");
}

TEST(GraphVerifier, RejectsMisplacedOutput)
{
    Graph g;
    GraphBuilder b(g);
    auto x = b.param("x");
    g.insertBefore(x.id, Opcode::Output, "", {Value::none()}, "output");
    EXPECT_EQ(failureCode(g), "V2004");
}

TEST(GraphVerifier, RejectsBadOperandLayouts)
{
    {
        Graph g;
        GraphBuilder b(g);
        auto a = b.call("f", {}, "a");
        b.exitScope(a);
        EXPECT_EQ(failureCode(g), "V2005");
    }
    {
        Graph g;
        addChild(g, "body", 0, 1);
        GraphBuilder b(g);
        auto ref = b.graphRef("body");
        auto r = b.region({}, ref, {});
        b.node(r).operands[0] = Value::constStr("cuda");
        EXPECT_EQ(failureCode(g), "V2005");
    }
    {
        Graph g;
        GraphBuilder b(g);
        auto a = b.call("f", {}, "a");
        b.getItem(a, -1);
        EXPECT_EQ(failureCode(g), "V2005");
    }
    {
        Graph g;
        GraphBuilder b(g);
        auto a = b.call("f", {}, "a");
        b.node(a).target.clear();
        EXPECT_EQ(failureCode(g), "V2005");
    }
}

TEST(GraphVerifier, RejectsMissingChildGraphs)
{
    Graph g;
    GraphBuilder b(g);
    b.graphRef("nowhere");
    EXPECT_EQ(failureCode(g), "V2006");
}

TEST(GraphVerifier, RejectsArgumentCountMismatch)
{
    Graph g;
    addChild(g, "body", 2, 1);
    GraphBuilder b(g);
    auto x = b.param("x");
    b.invoke("body", {x});
    EXPECT_EQ(failureCode(g), "V2007");
}

TEST(GraphVerifier, RejectsRegionArgumentCountMismatch)
{
    Graph g;
    addChild(g, "body", 1, 1);
    GraphBuilder b(g);
    auto ref = b.graphRef("body");
    b.region({Value::constStr("cpu")}, ref, {});
    EXPECT_EQ(failureCode(g), "V2007");
}

TEST(GraphVerifier, ChecksGetItemRange)
{
    Graph g;
    addChild(g, "pair", 0, 2);
    addChild(g, "single", 0, 1);
    GraphBuilder b(g);
    auto pair = b.invoke("pair", {});
    b.getItem(pair, 1);
    EXPECT_EQ(failureCode(g), "ok");

    auto bad = b.getItem(pair, 2);
    EXPECT_EQ(failureCode(g), "V2008");
    ASSERT_TRUE(g.erase(bad.id).hasValue());

    auto single = b.invoke("single", {});
    b.getItem(single, 0);
    EXPECT_EQ(failureCode(g), "V2008");
}

TEST(GraphVerifier, ReportsChildGraphPath)
{
    Graph g;
    addChild(g, "body", 1, 1);
    g.subgraph("body")->find(0)->name = "f";
    auto r = Verifier::verify(g);
    ASSERT_FALSE(r.hasValue());
    EXPECT_EQ(r.error().code, "V2001");
    EXPECT_EQ(r.error().message.rfind("main/body:", 0), 0u) << r.error().message;
}
