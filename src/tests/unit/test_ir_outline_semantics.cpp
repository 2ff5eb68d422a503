// File: src/tests/unit/test_ir_outline_semantics.cpp
// Purpose: Check that outlining preserves what every call computes and which
//          scope parameters it observes.
// Key invariants: The interpreter gives identical results before and after
//                 the rewrite for every fixture.

#include "ir/exec/Interpreter.hpp"
#include "ir/transform/OutlineScopes.hpp"

#include "ScopeGraphFixtures.hpp"

#include <gtest/gtest.h>

#include <string_view>

using namespace strata::core;
using namespace strata::exec;
using strata::testing::parseGraph;

namespace
{

/// Callee recording its name, its arguments and every active scope frame.
Callee tagging(std::string name)
{
    return [name](const std::vector<RtValue> &args, const ExecContext &ctx)
    {
        std::vector<RtValue> frames;
        for (const auto &scope : ctx.scopes())
            frames.push_back(RtValue::tuple(scope));
        return RtValue::tuple({RtValue::string(name), RtValue::tuple(args), RtValue::tuple(std::move(frames))});
    };
}

Interpreter makeInterpreter()
{
    Interpreter interp;
    for (const char *name : {"f", "g", "h", "k"})
        interp.registerCallee(name, tagging(name));
    return interp;
}

void expectSameBehaviour(std::string_view text)
{
    const Graph before = parseGraph(text);
    auto outlined = strata::transform::outlineScopes(before);
    ASSERT_TRUE(outlined.hasValue()) << outlined.error().message;

    Interpreter interp = makeInterpreter();
    auto expected = interp.run(before, {RtValue::integer(3)});
    ASSERT_TRUE(expected.hasValue()) << expected.error().message;
    auto actual = interp.run(outlined.value().graph, {RtValue::integer(3)});
    ASSERT_TRUE(actual.hasValue()) << actual.error().message;
    EXPECT_EQ(toString(actual.value()), toString(expected.value()));
}

} // namespace

TEST(OutlineSemantics, SingleScope)
{
    expectSameBehaviour(strata::testing::kSingleScope);
}

TEST(OutlineSemantics, ExitReadAfterScope)
{
    expectSameBehaviour(strata::testing::kExitReadAfterScope);
}

TEST(OutlineSemantics, TupleScope)
{
    expectSameBehaviour(strata::testing::kTupleScope);
}

TEST(OutlineSemantics, NestedScopes)
{
    expectSameBehaviour(strata::testing::kNestedScopes);
}

TEST(OutlineSemantics, SequentialScopes)
{
    expectSameBehaviour(strata::testing::kSequentialScopes);
}

TEST(OutlineSemantics, NoScopes)
{
    expectSameBehaviour(strata::testing::kNoScopes);
}

TEST(OutlineSemantics, CallsObserveTheirScope)
{
    const Graph before = parseGraph(strata::testing::kNestedScopes);
    Interpreter interp = makeInterpreter();
    auto r = interp.run(before, {RtValue::integer(3)});
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    // output (%e) with e = h(d), d = k(c) inside both scopes.
    const RtValue &e = r.value().elems.at(0);
    const RtValue &d = e.elems.at(1).elems.at(0);
    EXPECT_EQ(d.elems.at(2),
              RtValue::tuple({RtValue::tuple({RtValue::string("outer")}), RtValue::tuple({RtValue::string("inner")})}));
    EXPECT_EQ(e.elems.at(2), RtValue::tuple({}));
}
