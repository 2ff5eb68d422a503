//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_support_diagnostics.cpp
// Purpose: Test the diagnostic engine, Expected and source manager helpers.
// Key invariants: Printed diagnostics follow `path:line:col: severity[code]: msg`.
// Ownership/Lifetime: Not applicable.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_location.hpp"
#include "support/source_manager.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace strata::support;

TEST(SupportDiagnostics, SourceManagerNormalizesAndDeduplicates)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("graphs/./a.sg");
    EXPECT_EQ(id, 1u);
    EXPECT_EQ(sm.addFile("graphs/a.sg"), id);
    EXPECT_EQ(sm.addFile("graphs/b.sg"), 2u);
    EXPECT_EQ(sm.getPath(id), "graphs/a.sg");
    EXPECT_TRUE(sm.getPath(0).empty());
    EXPECT_TRUE(sm.getPath(7).empty());
}

TEST(SupportDiagnostics, PrintsLocationSeverityAndCode)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("main.sg");

    std::ostringstream os;
    printDiag(makeError("P3001", SourceLoc{id, 3, 5}, "unknown operation 'bogus'"), os, &sm);
    EXPECT_EQ(os.str(), "main.sg:3:5: error[P3001]: unknown operation 'bogus'\n");

    os.str("");
    printDiag(makeError("P3001", SourceLoc{0, 2, 1}, "unexpected token"), os);
    EXPECT_EQ(os.str(), "2:1: error[P3001]: unexpected token\n");

    os.str("");
    printDiag(makeError({}, "cannot open x.sg"), os, &sm);
    EXPECT_EQ(os.str(), "error: cannot open x.sg\n");
}

TEST(SupportDiagnostics, EngineCountsBySeverity)
{
    DiagnosticEngine de;
    de.report(makeError("S1001", {}, "bad nesting"));
    de.report(Diagnostic{Severity::Warning, "odd", {}, ""});
    de.report(Diagnostic{Severity::Note, "fyi", {}, ""});
    EXPECT_EQ(de.errorCount(), 1u);
    EXPECT_EQ(de.warningCount(), 1u);
    ASSERT_EQ(de.diagnostics().size(), 3u);

    std::ostringstream os;
    de.printAll(os);
    EXPECT_EQ(os.str(), "error[S1001]: bad nesting\nwarning: odd\nnote: fyi\n");
}

TEST(SupportDiagnostics, ExpectedCarriesValueOrDiag)
{
    Expected<int> ok(4);
    ASSERT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), 4);

    Expected<int> failed(makeError("I4001", {}, "missing"));
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().code, "I4001");

    Expected<void> done;
    EXPECT_TRUE(done.hasValue());
    Expected<void> broken(makeError({}, "nope"));
    EXPECT_FALSE(broken.hasValue());
    EXPECT_EQ(broken.error().message, "nope");
    EXPECT_FALSE(SourceLoc{}.isValid());
}
