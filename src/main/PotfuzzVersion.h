#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <string>

namespace potfuzz
{
// Defined in the build-generated PotfuzzVersion.cpp.
extern const std::string POTFUZZ_VERSION;
}
