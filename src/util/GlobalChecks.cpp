// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/GlobalChecks.h"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace potfuzz
{
void
dbgAbort()
{
    std::abort();
}

void
printAssertFailureAndAbort(const char* s1, const char* file, int line)
{
    std::fprintf(stderr, "%s at %s:%d\n", s1, file, line);
    std::fflush(stderr);
    dbgAbort();
    std::abort();
}

void
printAssertFailureAndThrow(const char* s1, const char* file, int line)
{
    std::fprintf(stderr, "%s at %s:%d\n", s1, file, line);
    std::fflush(stderr);
    throw std::runtime_error(s1);
}
}
