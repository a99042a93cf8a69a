// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "estimator/SeedHistory.h"
#include "util/GlobalChecks.h"

#include <fmt/format.h>
#include <stdexcept>

namespace potfuzz
{

SeedHistory::SeedHistory(std::vector<uint64_t> seeds,
                         std::vector<uint64_t> hashes)
    : mSeeds(std::move(seeds)), mHashes(std::move(hashes))
{
    if (mSeeds.size() != mHashes.size())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("history has {} seeds but {} hashes"),
                        mSeeds.size(), mHashes.size()));
    }
}

void
SeedHistory::append(uint64_t seed, uint64_t hash)
{
    mSeeds.emplace_back(seed);
    mHashes.emplace_back(hash);
    releaseAssert(mSeeds.size() == mHashes.size());
}

void
SeedHistory::append(SeedHistory const& other)
{
    // Copy first so that appending a history to itself is well defined.
    auto seeds = other.mSeeds;
    auto hashes = other.mHashes;
    mSeeds.insert(mSeeds.end(), seeds.begin(), seeds.end());
    mHashes.insert(mHashes.end(), hashes.begin(), hashes.end());
    releaseAssert(mSeeds.size() == mHashes.size());
}

size_t
SeedHistory::size() const
{
    return mSeeds.size();
}

bool
SeedHistory::empty() const
{
    return mSeeds.empty();
}

std::pair<uint64_t, uint64_t>
SeedHistory::at(size_t i) const
{
    return std::make_pair(mSeeds.at(i), mHashes.at(i));
}

bool
SeedHistory::operator==(SeedHistory const& other) const
{
    return mSeeds == other.mSeeds && mHashes == other.mHashes;
}

bool
SeedHistory::operator!=(SeedHistory const& other) const
{
    return !(*this == other);
}
}
