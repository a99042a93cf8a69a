// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

// Target module used by the harness tests. Most seeds map to a fixed
// function of the seed; a handful of reserved seeds exercise each way a
// target can misbehave.

#include "execution/test/TestTarget.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>

namespace
{
uint64_t
salt()
{
    char const* s = std::getenv("POTFUZZ_TEST_SALT");
    return s ? std::strtoull(s, nullptr, 10) : 0;
}
}

extern "C" uint64_t
test(uint64_t seed)
{
    using namespace potfuzz::testtarget;
    switch (seed)
    {
    case SEED_SENTINEL:
        std::printf("rejected seed %llu\n",
                    static_cast<unsigned long long>(seed));
        std::fprintf(stderr, "sentinel path\n");
        return UINT64_MAX;
    case SEED_ABORT:
        std::printf("about to abort\n");
        std::fflush(stdout);
        std::abort();
    case SEED_EXIT:
        std::exit(7);
    case SEED_HANG:
        for (;;)
        {
            ::pause();
        }
    case SEED_NOISY:
    {
        std::string line(1023, 'x');
        for (int i = 0; i < 256; ++i)
        {
            std::printf("%s\n", line.c_str());
        }
        return expectedHash(seed);
    }
    default:
        return expectedHash(seed) ^ salt();
    }
}

extern "C" uint64_t
alt_entry(uint64_t seed)
{
    return seed + 1;
}
