#pragma once

// Copyright 2015 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstdint>
#include <random>

namespace potfuzz
{
typedef std::mt19937_64 potfuzz_default_random_engine;

// Harness-wide engine for non-reproducible choices (scratch directory names
// and the like). Seeds fed to targets come from a per-session engine instead.
extern potfuzz_default_random_engine gRandomEngine;

// Pick a seed for a fresh session engine from the OS entropy source.
uint64_t randomSessionSeed();

// Reset all global PRNG state from a seed; used between unit tests.
void reinitializeAllGlobalStateWithSeed(unsigned int seed);
}
