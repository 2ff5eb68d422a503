/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     The diagnostic engine aggregates messages emitted by the tools and keeps
 *     track of severity counts. Diagnostics are stored until callers
 *     explicitly print or inspect them.
 */

#include "support/diagnostics.hpp"

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

namespace strata::support
{

/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * Notes are stored but do not touch either counter.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag` so the engine and the Expected-based
 * helpers print identical text.
 */
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sm);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

} // namespace strata::support
