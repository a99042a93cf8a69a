// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "estimator/HyperLogLog.h"
#include "estimator/EstimatorErrors.h"
#include "util/GlobalChecks.h"

#include <algorithm>
#include <bit>
#include <cmath>
#include <fmt/format.h>

namespace potfuzz
{

namespace
{
// 2^64 as a double.
constexpr double TWO_POW_64 = 18446744073709551616.0;

double
alphaFor(size_t m)
{
    switch (m)
    {
    case 16:
        return 0.673;
    case 32:
        return 0.697;
    case 64:
        return 0.709;
    default:
        return 0.7213 / (1.0 + 1.079 / static_cast<double>(m));
    }
}
}

void
HyperLogLog::checkPrecision(uint32_t precision)
{
    if (precision < MIN_PRECISION || precision > MAX_PRECISION)
    {
        throw InvalidPrecision(fmt::format(
            FMT_STRING("HyperLogLog precision {} outside [{}, {}]"), precision,
            MIN_PRECISION, MAX_PRECISION));
    }
}

HyperLogLog::HyperLogLog(uint32_t precision)
    : mPrecision(precision), mRegisters()
{
    checkPrecision(precision);
    mRegisters.assign(size_t(1) << precision, 0);
}

HyperLogLog::HyperLogLog(uint32_t precision, std::vector<uint8_t> registers)
    : mPrecision(precision), mRegisters(std::move(registers))
{
    checkPrecision(precision);
    if (mRegisters.size() != (size_t(1) << precision))
    {
        throw std::invalid_argument(fmt::format(
            FMT_STRING("precision {} needs {} registers, got {}"), precision,
            size_t(1) << precision, mRegisters.size()));
    }
    auto top = maxRank(precision);
    for (size_t i = 0; i < mRegisters.size(); ++i)
    {
        if (mRegisters[i] > top)
        {
            throw std::invalid_argument(
                fmt::format(FMT_STRING("register {} holds {}, above max {}"),
                            i, mRegisters[i], top));
        }
    }
}

uint64_t
HyperLogLog::mix64(uint64_t z)
{
    // SplitMix64 finalizer.
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

uint32_t
HyperLogLog::registerIndex(uint64_t value, uint32_t precision)
{
    return static_cast<uint32_t>(mix64(value) >> (64 - precision));
}

uint8_t
HyperLogLog::registerRank(uint64_t value, uint32_t precision)
{
    uint32_t width = 64 - precision;
    uint64_t w = mix64(value) & ((uint64_t(1) << width) - 1);
    if (w == 0)
    {
        return maxRank(precision);
    }
    // countl_zero counts over all 64 bits; the top `precision` are masked off.
    auto lz = static_cast<uint32_t>(std::countl_zero(w)) - precision;
    return static_cast<uint8_t>(lz + 1);
}

uint8_t
HyperLogLog::maxRank(uint32_t precision)
{
    return static_cast<uint8_t>(65 - precision);
}

void
HyperLogLog::add(uint64_t value)
{
    auto i = registerIndex(value, mPrecision);
    auto r = registerRank(value, mPrecision);
    releaseAssert(i < mRegisters.size());
    if (r > mRegisters[i])
    {
        mRegisters[i] = r;
    }
}

size_t
HyperLogLog::zeroRegisters() const
{
    return static_cast<size_t>(
        std::count(mRegisters.begin(), mRegisters.end(), uint8_t(0)));
}

double
HyperLogLog::count() const
{
    auto zeros = zeroRegisters();
    auto m = static_cast<double>(mRegisters.size());
    if (zeros == mRegisters.size())
    {
        return 0.0;
    }

    double z = 0.0;
    for (auto r : mRegisters)
    {
        z += std::ldexp(1.0, -static_cast<int>(r));
    }
    double e = alphaFor(mRegisters.size()) * m * m / z;

    // Each range below hands over at a value no lower than the one before
    // it, so raising any register never lowers the estimate.
    double const linearLimit = 2.5 * m;
    if (zeros > 0 && e <= linearLimit)
    {
        return std::min(m * std::log(m / static_cast<double>(zeros)),
                        linearLimit);
    }
    // A 64-bit hash space holds at most 2^64 distinct values.
    if (e >= TWO_POW_64)
    {
        return TWO_POW_64;
    }
    if (e > TWO_POW_64 / 30.0)
    {
        e = std::min(-TWO_POW_64 * std::log1p(-e / TWO_POW_64), TWO_POW_64);
    }
    return std::max(e, linearLimit);
}

void
HyperLogLog::merge(HyperLogLog const& other)
{
    if (other.mPrecision != mPrecision)
    {
        throw PrecisionMismatch(fmt::format(
            FMT_STRING("cannot merge HyperLogLog of precision {} into {}"),
            other.mPrecision, mPrecision));
    }
    releaseAssertOrThrow(mRegisters.size() == other.mRegisters.size());
    for (size_t i = 0; i < mRegisters.size(); ++i)
    {
        mRegisters[i] = std::max(mRegisters[i], other.mRegisters[i]);
    }
}

bool
HyperLogLog::operator==(HyperLogLog const& other) const
{
    return mPrecision == other.mPrecision && mRegisters == other.mRegisters;
}

bool
HyperLogLog::operator!=(HyperLogLog const& other) const
{
    return !(*this == other);
}
}
