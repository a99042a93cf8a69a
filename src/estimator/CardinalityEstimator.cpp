// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "estimator/CardinalityEstimator.h"
#include "util/Logging.h"

namespace potfuzz
{

CardinalityEstimator::CardinalityEstimator(uint32_t precision)
    : mSketch(precision), mHistory()
{
}

CardinalityEstimator::CardinalityEstimator(HyperLogLog sketch,
                                           SeedHistory history)
    : mSketch(std::move(sketch)), mHistory(std::move(history))
{
}

void
CardinalityEstimator::add(uint64_t seed, uint64_t outputHash)
{
    mSketch.add(outputHash);
    mHistory.append(seed, outputHash);
}

double
CardinalityEstimator::count() const
{
    return mSketch.count();
}

void
CardinalityEstimator::merge(CardinalityEstimator const& other)
{
    mSketch.merge(other.mSketch);
    mHistory.append(other.mHistory);
    CLOG_DEBUG(Estimator, "Merged {} history entries, {} total",
               other.mHistory.size(), mHistory.size());
}

bool
CardinalityEstimator::operator==(CardinalityEstimator const& other) const
{
    return mSketch == other.mSketch && mHistory == other.mHistory;
}

bool
CardinalityEstimator::operator!=(CardinalityEstimator const& other) const
{
    return !(*this == other);
}
}
