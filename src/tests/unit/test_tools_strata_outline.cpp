// File: src/tests/unit/test_tools_strata_outline.cpp
// Purpose: Drive the strata-outline command line through runCLI.
// Key invariants: Exit status is 0 on success and 1 on any diagnostic.
// Ownership/Lifetime: Each test writes its input to a temporary file it
//                     removes afterwards.

#include "support/source_manager.hpp"
#include "tools/strata-outline/driver.hpp"

#include "ScopeGraphFixtures.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace
{

struct CliResult
{
    int status = 0;
    std::string out;
    std::string err;
};

CliResult runTool(std::vector<std::string> args)
{
    args.insert(args.begin(), "strata-outline");
    std::vector<char *> argv;
    for (auto &a : args)
        argv.push_back(a.data());
    argv.push_back(nullptr);

    std::ostringstream out;
    std::ostringstream err;
    strata::support::SourceManager sm;
    CliResult result;
    result.status =
        strata::tools::outline::runCLI(static_cast<int>(args.size()), argv.data(), out, err, sm);
    result.out = out.str();
    result.err = err.str();
    return result;
}

class TempGraphFile
{
  public:
    TempGraphFile(const std::string &name, std::string_view text)
        : path_(fs::temp_directory_path() / ("strata_outline_" + name + ".sg"))
    {
        std::ofstream os(path_);
        os << text;
    }

    ~TempGraphFile()
    {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    [[nodiscard]] std::string path() const
    {
        return path_.string();
    }

  private:
    fs::path path_;
};

} // namespace

TEST(StrataOutlineTool, PrintsOutlinedGraphAndSignature)
{
    TempGraphFile file("single", strata::testing::kSingleScope);
    const CliResult r = runTool({"--outputs", "result", file.path()});
    EXPECT_EQ(r.status, 0) << r.err;
    EXPECT_NE(r.out.find("%c = region((\"cuda\", \"f16\", true), %submod_1, %a)"), std::string::npos) << r.out;
    EXPECT_NE(r.out.find("# output result -> %e"), std::string::npos) << r.out;
    EXPECT_EQ(r.out.find("scope.enter"), std::string::npos);
    EXPECT_TRUE(r.err.empty()) << r.err;
}

TEST(StrataOutlineTool, TracesToErrorStream)
{
    TempGraphFile file("trace", strata::testing::kSequentialScopes);
    const CliResult r = runTool({"--trace", file.path()});
    EXPECT_EQ(r.status, 0) << r.err;
    EXPECT_NE(r.err.find("[outline] done: 2 region(s)"), std::string::npos) << r.err;
}

TEST(StrataOutlineTool, NoRecurseKeepsNestedMarkers)
{
    TempGraphFile file("nested", strata::testing::kNestedScopes);
    const CliResult r = runTool({"--no-recurse", file.path()});
    EXPECT_EQ(r.status, 0) << r.err;
    EXPECT_NE(r.out.find("scope.enter(\"inner\")"), std::string::npos) << r.out;
    EXPECT_EQ(r.out.find("scope.enter(\"outer\")"), std::string::npos) << r.out;
}

TEST(StrataOutlineTool, ReportsParseErrorsWithLocation)
{
    TempGraphFile file("broken", "graph main {\n  %x = param\n  %y = bogus(%x)\n}\n");
    const CliResult r = runTool({file.path()});
    EXPECT_EQ(r.status, 1);
    EXPECT_NE(r.err.find(file.path() + ":3:"), std::string::npos) << r.err;
    EXPECT_NE(r.err.find("error[P3001]"), std::string::npos) << r.err;
}

TEST(StrataOutlineTool, ReportsPassDiagnostics)
{
    TempGraphFile file("unbalanced", R"(graph main {
  %x = param
  %b = scope.enter("cpu")
  %c = call g(%x)
  output (%c)
}
)");
    const CliResult r = runTool({file.path()});
    EXPECT_EQ(r.status, 1);
    EXPECT_NE(r.err.find("error[S1002]"), std::string::npos) << r.err;
}

TEST(StrataOutlineTool, ReportsMissingFile)
{
    const CliResult r = runTool({"/nonexistent/strata/input.sg"});
    EXPECT_EQ(r.status, 1);
    EXPECT_NE(r.err.find("cannot open /nonexistent/strata/input.sg"), std::string::npos) << r.err;
}

TEST(StrataOutlineTool, HandlesVersionHelpAndBadUsage)
{
    CliResult r = runTool({"--version"});
    EXPECT_EQ(r.status, 0);
    EXPECT_EQ(r.out, "strata-outline v0.1.0\n");

    r = runTool({"--help"});
    EXPECT_EQ(r.status, 0);
    EXPECT_EQ(r.out.rfind("Usage: strata-outline", 0), 0u);

    r = runTool({});
    EXPECT_EQ(r.status, 1);
    EXPECT_NE(r.err.find("Usage: strata-outline"), std::string::npos);

    r = runTool({"--frobnicate", "x.sg"});
    EXPECT_EQ(r.status, 1);
    EXPECT_NE(r.err.find("unknown option '--frobnicate'"), std::string::npos);
}
