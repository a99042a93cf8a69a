#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "execution/ExecutionOutcome.h"

#include <cstdint>
#include <stdexcept>

namespace potfuzz
{

// Replaying a recorded seed did not reproduce the recorded hash.
class VerificationMismatch : public std::runtime_error
{
    size_t const mIndex;
    uint64_t const mSeed;
    uint64_t const mExpected;
    ExecutionOutcome const mActual;

  public:
    VerificationMismatch(size_t index, uint64_t seed, uint64_t expected,
                         ExecutionOutcome actual);

    size_t
    getIndex() const
    {
        return mIndex;
    }

    uint64_t
    getSeed() const
    {
        return mSeed;
    }

    uint64_t
    getExpected() const
    {
        return mExpected;
    }

    ExecutionOutcome const&
    getActual() const
    {
        return mActual;
    }
};
}
