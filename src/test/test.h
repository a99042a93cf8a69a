#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <string>
#include <vector>

namespace potfuzz
{

int runTest(std::vector<std::string> const& args);

// Scratch directory for this test process; removed when the run ends.
std::string const& getTestTmpRoot();

// Paths of the target modules built alongside the tests.
std::string getTestTargetPath();
std::string getTestTargetNoEntryPath();
std::string getTestRunnerPath();
}
