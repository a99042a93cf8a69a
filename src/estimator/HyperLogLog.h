#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstddef>
#include <cstdint>
#include <vector>

namespace potfuzz
{

// HyperLogLog sketch over 64-bit values: 2^precision one-byte registers, each
// holding the maximum observed rank for the values routed to it. The sketch
// is a plain value; copying it copies the registers.
//
// Values are passed through a 64-bit finalizer before being split into a
// register index (top `precision` bits) and a rank (1 + leading zeros of the
// remaining 64 - precision bits), so targets returning poorly mixed values
// (small counters, aligned pointers) still spread across registers.
class HyperLogLog
{
  public:
    static constexpr uint32_t MIN_PRECISION = 4;
    static constexpr uint32_t MAX_PRECISION = 16;
    static constexpr uint32_t DEFAULT_PRECISION = 6;

  private:
    uint32_t mPrecision;
    std::vector<uint8_t> mRegisters;

  public:
    // Throws InvalidPrecision outside [MIN_PRECISION, MAX_PRECISION].
    explicit HyperLogLog(uint32_t precision = DEFAULT_PRECISION);

    // Rebuild a sketch from persisted registers. Throws InvalidPrecision on a
    // bad precision and std::invalid_argument on a wrong register count or an
    // out-of-range register value.
    HyperLogLog(uint32_t precision, std::vector<uint8_t> registers);

    void add(uint64_t value);

    // Cardinality estimate of the values added so far; 0.0 for an empty
    // sketch, never negative.
    double count() const;

    // Element-wise max with `other`. Throws PrecisionMismatch.
    void merge(HyperLogLog const& other);

    uint32_t
    getPrecision() const
    {
        return mPrecision;
    }

    std::vector<uint8_t> const&
    getRegisters() const
    {
        return mRegisters;
    }

    std::size_t
    numRegisters() const
    {
        return mRegisters.size();
    }

    std::size_t zeroRegisters() const;

    static uint64_t mix64(uint64_t value);
    static uint32_t registerIndex(uint64_t value, uint32_t precision);
    static uint8_t registerRank(uint64_t value, uint32_t precision);
    static uint8_t maxRank(uint32_t precision);
    static void checkPrecision(uint32_t precision);

    bool operator==(HyperLogLog const& other) const;
    bool operator!=(HyperLogLog const& other) const;
};
}
