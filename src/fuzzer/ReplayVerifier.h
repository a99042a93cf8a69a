#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstddef>

namespace potfuzz
{

class CardinalityEstimator;
class ExecutionAdapter;

// Re-runs every recorded seed, in recorded order, and checks the target
// still returns the recorded hash.
class ReplayVerifier
{
    ExecutionAdapter& mAdapter;

  public:
    explicit ReplayVerifier(ExecutionAdapter& adapter);

    // Returns the number of pairs replayed. Throws VerificationMismatch at
    // the first divergent pair, without invoking the target on later ones.
    size_t verify(CardinalityEstimator const& estimator);
};
}
