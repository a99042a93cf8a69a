// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

// Loadable module that exports no `test` symbol.

#include <cstdint>

extern "C" uint64_t
not_the_entry_point(uint64_t seed)
{
    return seed;
}
