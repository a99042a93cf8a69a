#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "fuzzer/FuzzLoop.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace potfuzz
{

class Config;
class ExecutionAdapter;

struct SnapshotSummary
{
    std::string mPath;
    bool mExists{false};
    uint32_t mPrecision{0};
    size_t mRegisters{0};
    size_t mNonZeroRegisters{0};
    size_t mHistoryLength{0};
    double mEstimate{0.0};
};

// Session-level operations: each resolves the target's adapter and snapshot
// from the configuration, runs one controller and persists the result.

// Throws AdapterConstructionError.
std::unique_ptr<ExecutionAdapter> makeAdapter(Config const& cfg,
                                              std::string const& target);

// Fuzz `target` for `iterations` rounds, starting from its snapshot (or a
// fresh estimator at DEFAULT_PRECISION) and saving the result back.
FuzzReport runFuzzSession(Config const& cfg, std::string const& target,
                          uint64_t iterations,
                          std::optional<uint64_t> initialSeed = std::nullopt);

// Replay the target's snapshot. Throws MissingSnapshot if there is none and
// VerificationMismatch on the first divergence.
size_t runVerifySession(Config const& cfg, std::string const& target);

// Merge the snapshot at `otherSnapshotPath` into the target's snapshot
// (fresh if absent) and save it. Throws MissingSnapshot if the other file
// does not exist and PrecisionMismatch if the precisions differ. Returns the
// merged history length.
size_t runMergeSession(Config const& cfg, std::string const& target,
                       std::string const& otherSnapshotPath);

SnapshotSummary describeSnapshot(Config const& cfg, std::string const& target);
}
