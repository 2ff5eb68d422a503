//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the strata-outline pipeline: load the graph text, verify it,
// derive the output signature requested with --outputs, run the scope
// outlining pass and print the rewritten graph followed by the signature.
//
//===----------------------------------------------------------------------===//

#include "tools/strata-outline/driver.hpp"

#include "strata/ir/IO.hpp"
#include "strata/ir/Verify.hpp"
#include "strata/pass/OutlineScopes.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <fstream>
#include <ostream>
#include <string>

namespace strata::tools::outline
{

namespace
{

constexpr const char *kUsage = "Usage: strata-outline [--no-recurse] [--no-verify] [--trace] "
                               "[--outputs n1,n2,...] <file.sg>\n";

std::vector<std::string> splitNames(std::string_view text)
{
    std::vector<std::string> names;
    size_t start = 0;
    while (start <= text.size())
    {
        const size_t comma = text.find(',', start);
        const size_t end = comma == std::string_view::npos ? text.size() : comma;
        if (end > start)
            names.emplace_back(text.substr(start, end - start));
        if (comma == std::string_view::npos)
            break;
        start = comma + 1;
    }
    return names;
}

/// Runs the pipeline, recording the first failure in @p de.
bool outlineFile(const std::string &path,
                 const OutlineToolOptions &opts,
                 std::ostream &out,
                 std::ostream &err,
                 support::SourceManager &sm,
                 support::DiagnosticEngine &de)
{
    const uint32_t fileId = sm.addFile(path);
    if (fileId == 0)
    {
        de.report(support::makeError({}, "source manager exhausted file identifier space"));
        return false;
    }

    std::ifstream in(path);
    if (!in)
    {
        de.report(support::makeError({}, "cannot open " + path));
        return false;
    }

    auto parsed = io::Parser::parse(in, fileId);
    if (!parsed)
    {
        de.report(parsed.error());
        return false;
    }
    const core::Graph &graph = parsed.value();

    if (opts.common.verify)
    {
        if (auto v = verify::Verifier::verify(graph); !v)
        {
            de.report(v.error());
            return false;
        }
    }

    std::optional<transform::OutputSignature> signature;
    if (opts.outputs)
        signature = transform::OutputSignature::fromGraph(graph, *opts.outputs);

    transform::OutlineScopesConfig config;
    config.recurse = opts.recurse;
    config.verify = opts.common.verify;
    config.trace = opts.common.trace ? &err : nullptr;

    auto result = transform::outlineScopes(graph, std::move(signature), config);
    if (!result)
    {
        de.report(result.error());
        return false;
    }

    io::Serializer::write(result.value().graph, out);
    if (const auto &sig = result.value().signature)
    {
        for (const auto &spec : sig->specs())
            out << "# output " << spec.declaredName << " -> " << (spec.valueName ? "%" + *spec.valueName : "none")
                << '\n';
    }
    return true;
}

} // namespace

bool runOutlinePipeline(std::string_view path,
                        const OutlineToolOptions &opts,
                        std::ostream &out,
                        std::ostream &err,
                        support::SourceManager &sm)
{
    support::DiagnosticEngine de;
    const bool ok = outlineFile(std::string(path), opts, out, err, sm, de);
    de.printAll(err, &sm);
    return ok && de.errorCount() == 0;
}

int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err, support::SourceManager &sm)
{
    OutlineToolOptions opts;
    std::optional<std::string> path;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--version")
        {
            out << "strata-outline v0.1.0\n";
            return 0;
        }
        if (arg == "--help" || arg == "-h")
        {
            out << kUsage;
            return 0;
        }
        if (arg == "--no-recurse")
            opts.recurse = false;
        else if (arg == "--no-verify")
            opts.common.verify = false;
        else if (arg == "--trace")
            opts.common.trace = true;
        else if (arg == "--outputs" && i + 1 < argc)
            opts.outputs = splitNames(argv[++i]);
        else if (!arg.empty() && arg[0] == '-')
        {
            err << "unknown option '" << arg << "'\n" << kUsage;
            return 1;
        }
        else if (!path)
            path = arg;
        else
        {
            err << kUsage;
            return 1;
        }
    }
    if (!path)
    {
        err << kUsage;
        return 1;
    }
    return runOutlinePipeline(*path, opts, out, err, sm) ? 0 : 1;
}

} // namespace strata::tools::outline
