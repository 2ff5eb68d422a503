//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Entry point for the `strata-outline` binary.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"
#include "tools/strata-outline/driver.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    strata::support::SourceManager sm;
    return strata::tools::outline::runCLI(argc, argv, std::cout, std::cerr, sm);
}
