#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstdint>

namespace potfuzz
{
namespace testtarget
{
// Seeds with special behaviour in the test target module.
constexpr uint64_t SEED_SENTINEL = 1;
constexpr uint64_t SEED_ABORT = 2;
constexpr uint64_t SEED_EXIT = 3;
constexpr uint64_t SEED_HANG = 4;
constexpr uint64_t SEED_NOISY = 5;

// What the test target returns for an ordinary seed when
// POTFUZZ_TEST_SALT is unset.
inline uint64_t
expectedHash(uint64_t seed)
{
    uint64_t z = seed * 0x9e3779b97f4a7c15ULL;
    return (z ^ (z >> 32)) & 0x7fffffffffffffffULL;
}
}
}
