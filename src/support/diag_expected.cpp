//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.cpp
// Purpose: Implements the void Expected specialisation and diagnostic printing.
// Key invariants: Printed diagnostics follow "path:line:col: severity[code]: msg".
// Ownership/Lifetime: Stateless helpers.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace strata::support
{

Expected<void>::Expected(Diag diag) : error_(std::move(diag)) {}

bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc};
}

Diag makeError(std::string code, SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc, std::move(code)};
}

/// @brief Print @p diag, prefixing the file path and position when known.
/// @details The code, when present, is appended to the severity in brackets so
///          tests and tools can match on it without parsing the message.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    if (sm && diag.loc.isValid())
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            if (diag.loc.line != 0)
            {
                os << ':' << diag.loc.line;
                if (diag.loc.column != 0)
                {
                    os << ':' << diag.loc.column;
                }
            }
            os << ": ";
        }
    }
    else if (diag.loc.hasLine())
    {
        os << diag.loc.line << ':' << diag.loc.column << ": ";
    }
    os << detail::diagSeverityToString(diag.severity);
    if (!diag.code.empty())
        os << '[' << diag.code << ']';
    os << ": " << diag.message << '\n';
}

} // namespace strata::support
