// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "fuzzer/FuzzLoop.h"
#include "estimator/CardinalityEstimator.h"
#include "execution/ExecutionAdapter.h"
#include "util/Logging.h"
#include "util/Math.h"

#include <random>

namespace potfuzz
{

FuzzLoop::FuzzLoop(ExecutionAdapter& adapter, CardinalityEstimator& estimator,
                   uint64_t progressInterval)
    : mAdapter(adapter)
    , mEstimator(estimator)
    , mProgressInterval(progressInterval)
{
}

FuzzReport
FuzzLoop::run(uint64_t iterations, std::optional<uint64_t> engineSeed)
{
    FuzzReport report;
    report.mEngineSeed = engineSeed ? *engineSeed : randomSessionSeed();
    std::mt19937_64 engine(report.mEngineSeed);

    report.mStartCount = mEstimator.count();
    CLOG_INFO(Fuzz, "Fuzzing {} for {} iterations, initial seed {}",
              mAdapter.getTarget(), iterations, report.mEngineSeed);
    CLOG_INFO(Fuzz, "Start count: {}", report.mStartCount);

    for (uint64_t i = 0; i < iterations; ++i)
    {
        uint64_t seed = engine();
        auto outcome = mAdapter.invoke(seed);
        ++report.mIterations;
        if (outcome.isSuccess())
        {
            mEstimator.add(seed, outcome.getHash());
            ++report.mSuccesses;
        }
        else
        {
            ++report.mFailures;
            CLOG_WARNING(Fuzz, "Seed {} failed:\n{}", seed,
                         outcome.getDiagnostic());
        }

        if (mProgressInterval != 0 && (i + 1) % mProgressInterval == 0)
        {
            CLOG_DEBUG(Fuzz, "{}/{} iterations, {} failures, count {}", i + 1,
                       iterations, report.mFailures, mEstimator.count());
        }
    }

    report.mEndCount = mEstimator.count();
    CLOG_INFO(Fuzz, "End count: {}", report.mEndCount);
    if (report.mFailures != 0)
    {
        CLOG_INFO(Fuzz, "{} of {} iterations failed", report.mFailures,
                  report.mIterations);
    }
    return report;
}
}
