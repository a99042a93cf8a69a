#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "estimator/HyperLogLog.h"
#include "estimator/SeedHistory.h"

namespace potfuzz
{

// Estimates how many distinct output hashes a target has produced, and keeps
// the (seed, hash) pairs that fed it so a later session can replay them.
class CardinalityEstimator
{
    HyperLogLog mSketch;
    SeedHistory mHistory;

  public:
    explicit CardinalityEstimator(
        uint32_t precision = HyperLogLog::DEFAULT_PRECISION);
    CardinalityEstimator(HyperLogLog sketch, SeedHistory history);

    // Record one successful invocation. Never fails.
    void add(uint64_t seed, uint64_t outputHash);

    double count() const;

    // Throws PrecisionMismatch if the sketches differ in precision; on
    // success registers are maxed and other's history is appended to ours.
    void merge(CardinalityEstimator const& other);

    uint32_t
    getPrecision() const
    {
        return mSketch.getPrecision();
    }

    HyperLogLog const&
    getSketch() const
    {
        return mSketch;
    }

    SeedHistory const&
    getHistory() const
    {
        return mHistory;
    }

    bool operator==(CardinalityEstimator const& other) const;
    bool operator!=(CardinalityEstimator const& other) const;
};
}
