#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstdint>
#include <optional>

namespace potfuzz
{

class CardinalityEstimator;
class ExecutionAdapter;

struct FuzzReport
{
    uint64_t mIterations{0};
    uint64_t mSuccesses{0};
    uint64_t mFailures{0};
    uint64_t mEngineSeed{0};
    double mStartCount{0.0};
    double mEndCount{0.0};
};

// Feeds pseudo-random seeds to a target and records every successful result
// in the estimator. Failed invocations are logged and skipped.
class FuzzLoop
{
    ExecutionAdapter& mAdapter;
    CardinalityEstimator& mEstimator;
    uint64_t mProgressInterval;

  public:
    static constexpr uint64_t DEFAULT_PROGRESS_INTERVAL = 100000;

    FuzzLoop(ExecutionAdapter& adapter, CardinalityEstimator& estimator,
             uint64_t progressInterval = DEFAULT_PROGRESS_INTERVAL);

    // Runs `iterations` rounds. The seed sequence is drawn from an engine
    // seeded with `engineSeed`, or from the OS entropy source if none is
    // given; the engine seed actually used is logged and reported so a run
    // can be repeated.
    FuzzReport run(uint64_t iterations,
                   std::optional<uint64_t> engineSeed = std::nullopt);
};
}
