// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "fuzzer/ReplayVerifier.h"
#include "estimator/CardinalityEstimator.h"
#include "execution/ExecutionAdapter.h"
#include "fuzzer/VerificationMismatch.h"
#include "util/Logging.h"

#include <fmt/format.h>

namespace potfuzz
{

VerificationMismatch::VerificationMismatch(size_t index, uint64_t seed,
                                           uint64_t expected,
                                           ExecutionOutcome actual)
    : std::runtime_error(fmt::format(
          FMT_STRING("verification failed at entry {}: seed {} expected {}, "
                     "got {}"),
          index, seed, expected, actual.toString()))
    , mIndex(index)
    , mSeed(seed)
    , mExpected(expected)
    , mActual(std::move(actual))
{
}

ReplayVerifier::ReplayVerifier(ExecutionAdapter& adapter) : mAdapter(adapter)
{
}

size_t
ReplayVerifier::verify(CardinalityEstimator const& estimator)
{
    auto const& history = estimator.getHistory();
    CLOG_INFO(Fuzz, "Verifying {} recorded results for {}", history.size(),
              mAdapter.getTarget());

    for (size_t i = 0; i < history.size(); ++i)
    {
        auto [seed, expected] = history.at(i);
        auto outcome = mAdapter.invoke(seed);
        if (!outcome.isSuccess() || outcome.getHash() != expected)
        {
            CLOG_ERROR(Fuzz, "Entry {} (seed {}) expected {}, got {}", i, seed,
                       expected, outcome.toString());
            throw VerificationMismatch(i, seed, expected, std::move(outcome));
        }
    }

    CLOG_INFO(Fuzz, "Verification passed");
    return history.size();
}
}
