// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/Math.h"

namespace potfuzz
{

potfuzz_default_random_engine gRandomEngine{std::random_device{}()};

uint64_t
randomSessionSeed()
{
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) | rd();
}

void
reinitializeAllGlobalStateWithSeed(unsigned int seed)
{
    gRandomEngine.seed(seed);
}
}
