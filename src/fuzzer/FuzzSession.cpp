// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "fuzzer/FuzzSession.h"
#include "estimator/CardinalityEstimator.h"
#include "execution/SharedObjectAdapter.h"
#include "fuzzer/ReplayVerifier.h"
#include "main/Config.h"
#include "snapshot/SnapshotError.h"
#include "snapshot/SnapshotStore.h"
#include "util/Logging.h"

#include <chrono>

namespace potfuzz
{

namespace
{
SnapshotStore
storeFor(Config const& cfg, std::string const& target)
{
    return SnapshotStore(
        SnapshotStore::pathForTarget(target, cfg.SNAPSHOT_DIR));
}

CardinalityEstimator
loadOrFresh(Config const& cfg, SnapshotStore const& store)
{
    auto loaded = store.load();
    if (loaded)
    {
        if (loaded->getPrecision() != cfg.DEFAULT_PRECISION)
        {
            CLOG_INFO(Fuzz,
                      "Snapshot {} has precision {}, keeping it over "
                      "configured {}",
                      store.getPath(), loaded->getPrecision(),
                      cfg.DEFAULT_PRECISION);
        }
        return std::move(*loaded);
    }
    CLOG_INFO(Fuzz, "No snapshot at {}, starting fresh with precision {}",
              store.getPath(), cfg.DEFAULT_PRECISION);
    return CardinalityEstimator(cfg.DEFAULT_PRECISION);
}
}

std::unique_ptr<ExecutionAdapter>
makeAdapter(Config const& cfg, std::string const& target)
{
    return std::make_unique<SharedObjectAdapter>(
        target, cfg.ENTRY_POINT,
        std::chrono::milliseconds(cfg.INVOCATION_TIMEOUT_MS),
        cfg.RUNNER_PATH);
}

FuzzReport
runFuzzSession(Config const& cfg, std::string const& target,
               uint64_t iterations, std::optional<uint64_t> initialSeed)
{
    auto adapter = makeAdapter(cfg, target);
    auto store = storeFor(cfg, target);
    auto estimator = loadOrFresh(cfg, store);

    FuzzLoop loop(*adapter, estimator, cfg.PROGRESS_INTERVAL);
    auto report = loop.run(iterations, initialSeed);

    store.save(estimator);
    return report;
}

size_t
runVerifySession(Config const& cfg, std::string const& target)
{
    auto adapter = makeAdapter(cfg, target);
    auto store = storeFor(cfg, target);
    auto estimator = store.load();
    if (!estimator)
    {
        throw MissingSnapshot("no snapshot to verify at " + store.getPath());
    }

    ReplayVerifier verifier(*adapter);
    return verifier.verify(*estimator);
}

size_t
runMergeSession(Config const& cfg, std::string const& target,
                std::string const& otherSnapshotPath)
{
    SnapshotStore other(otherSnapshotPath);
    auto theirs = other.load();
    if (!theirs)
    {
        throw MissingSnapshot("no snapshot to merge at " + otherSnapshotPath);
    }

    auto store = storeFor(cfg, target);
    auto ours = store.load();
    if (!ours)
    {
        // Start from an empty sketch at the incoming precision.
        ours.emplace(theirs->getPrecision());
    }

    auto before = ours->count();
    ours->merge(*theirs);
    store.save(*ours);
    CLOG_INFO(Fuzz, "Merged {} into {}: count {} -> {}", otherSnapshotPath,
              store.getPath(), before, ours->count());
    return ours->getHistory().size();
}

SnapshotSummary
describeSnapshot(Config const& cfg, std::string const& target)
{
    auto store = storeFor(cfg, target);
    SnapshotSummary summary;
    summary.mPath = store.getPath();

    auto est = store.load();
    if (!est)
    {
        return summary;
    }
    auto const& sketch = est->getSketch();
    summary.mExists = true;
    summary.mPrecision = sketch.getPrecision();
    summary.mRegisters = sketch.numRegisters();
    summary.mNonZeroRegisters = sketch.numRegisters() - sketch.zeroRegisters();
    summary.mHistoryLength = est->getHistory().size();
    summary.mEstimate = est->count();
    return summary;
}
}
