// File: src/tests/unit/ScopeGraphFixtures.hpp
// Purpose: Shared graph texts and helpers for the scope outlining tests.
// Key invariants: Every fixture parses and verifies.
// Ownership/Lifetime: Helpers return graphs by value.
#pragma once

#include "ir/core/Graph.hpp"
#include "ir/io/Parser.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <utility>

namespace strata::testing
{

/// One scope around a single call, with a call before and after it.
inline constexpr std::string_view kSingleScope = R"(graph main {
  %x = param : f32[4]
  %a = call f(%x) : f32[4]
  %b = scope.enter("cuda", "f16", true) !{"L__self__": "Model"}
  %c = call g(%a) : f32[4]
  %d = scope.exit(%b)
  %e = call h(%c) : f32[4]
  output (%e)
}
)";

/// The value of the scope.exit itself is read after the scope.
inline constexpr std::string_view kExitReadAfterScope = R"(graph main {
  %x = param : f32[4]
  %a = call f(%x) : f32[4]
  %b = scope.enter()
  %c = call g(%a) : f32[4]
  %d = scope.exit(%b)
  %e = call h(%d) : f32[4]
  output (%e)
}
)";

/// A scope whose body produces two values read after the scope.
inline constexpr std::string_view kTupleScope = R"(graph main {
  %x = param : f32[4]
  %b = scope.enter("cpu", "bf16")
  %c = call g(%x) : f32[4]
  %d2 = call k(%x) : i64
  %ex = scope.exit(%b)
  %e = call h(%c, %d2) : f32[4]
  output (%e)
}
)";

/// An inner scope nested in an outer one.
inline constexpr std::string_view kNestedScopes = R"(graph main {
  %x = param
  %b1 = scope.enter("outer")
  %c = call g(%x)
  %b2 = scope.enter("inner")
  %d = call k(%c)
  %ex2 = scope.exit(%b2)
  %ex1 = scope.exit(%b1)
  %e = call h(%d)
  output (%e)
}
)";

/// Two scopes back to back.
inline constexpr std::string_view kSequentialScopes = R"(graph main {
  %x = param
  %b1 = scope.enter("first")
  %c1 = call g(%x)
  %ex1 = scope.exit(%b1)
  %b2 = scope.enter("second")
  %c2 = call k(%c1)
  %ex2 = scope.exit(%b2)
  %e = call h(%c2)
  output (%e)
}
)";

/// No scope markers at all.
inline constexpr std::string_view kNoScopes = R"(graph main {
  %x = param
  %a = call f(%x)
  %b = call g(%a)
  output (%b)
}
)";

/// Parse @p text, failing the current test on error.
inline core::Graph parseGraph(std::string_view text)
{
    auto parsed = io::Parser::parseString(text);
    EXPECT_TRUE(parsed.hasValue()) << (parsed ? std::string() : parsed.error().message);
    if (!parsed)
        return core::Graph();
    return std::move(parsed.value());
}

/// Names of the nodes of @p g in program order, joined by spaces.
inline std::string nodeNames(const core::Graph &g)
{
    std::string names;
    for (const auto &n : g.nodes())
    {
        if (!names.empty())
            names += ' ';
        names += n.name;
    }
    return names;
}

} // namespace strata::testing
