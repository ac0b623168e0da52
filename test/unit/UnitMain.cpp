//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>

bool runRuntimeTests();
bool runSerdeTests();
bool runCompareTests();
bool runCaseRegistryTests();
bool runOwnedBufferTests();
bool runRoundTripOracleTests();
bool runHarnessConfigTests();
bool runBoundaryTests();

int main()
{
    bool ok = true;
    ok      = runRuntimeTests() && ok;
    ok      = runSerdeTests() && ok;
    ok      = runCompareTests() && ok;
    ok      = runCaseRegistryTests() && ok;
    ok      = runOwnedBufferTests() && ok;
    ok      = runHarnessConfigTests() && ok;
    ok      = runBoundaryTests() && ok;
    ok      = runRoundTripOracleTests() && ok;
    if (!ok)
    {
        std::cerr << "unit tests failed\n";
        return 1;
    }
    std::cout << "unit tests passed\n";
    return 0;
}
