#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace potfuzz
{

// Append-only log of (seed, output hash) pairs, in the order they were
// observed. Stored as two index-aligned vectors so that it maps directly onto
// the persisted "seeds" / "hashes" arrays.
class SeedHistory
{
    std::vector<uint64_t> mSeeds;
    std::vector<uint64_t> mHashes;

  public:
    SeedHistory() = default;

    // Throws std::invalid_argument if the vectors differ in length.
    SeedHistory(std::vector<uint64_t> seeds, std::vector<uint64_t> hashes);

    void append(uint64_t seed, uint64_t hash);
    void append(SeedHistory const& other);

    std::size_t size() const;
    bool empty() const;

    std::pair<uint64_t, uint64_t> at(std::size_t i) const;

    std::vector<uint64_t> const&
    getSeeds() const
    {
        return mSeeds;
    }

    std::vector<uint64_t> const&
    getHashes() const
    {
        return mHashes;
    }

    bool operator==(SeedHistory const& other) const;
    bool operator!=(SeedHistory const& other) const;
};
}
