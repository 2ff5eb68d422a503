//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.cpp
// Purpose: Implements validity queries for source locations.
// Key invariants: A location is valid exactly when it names a registered file.
// Ownership/Lifetime: Value type helpers only.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace strata::support
{

/// @return True when the location carries a non-zero file identifier.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

} // namespace strata::support
