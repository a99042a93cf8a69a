// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "estimator/CardinalityEstimator.h"
#include "fuzzer/FuzzLoop.h"
#include "fuzzer/ReplayVerifier.h"
#include "fuzzer/VerificationMismatch.h"
#include "test/Catch2.h"
#include "test/TestUtils.h"

#include <random>

using namespace potfuzz;
using namespace potfuzz::testutil;

TEST_CASE("fuzz loop records successes", "[fuzz]")
{
    FakeAdapter adapter(succeedWith([](uint64_t s) { return s % 1000; }));
    CardinalityEstimator est;
    FuzzLoop loop(adapter, est);

    auto report = loop.run(200, 7);
    REQUIRE(report.mIterations == 200);
    REQUIRE(report.mSuccesses == 200);
    REQUIRE(report.mFailures == 0);
    REQUIRE(report.mEngineSeed == 7);
    REQUIRE(report.mStartCount == 0.0);
    REQUIRE(report.mEndCount == est.count());
    REQUIRE(report.mEndCount > 0.0);

    auto const& h = est.getHistory();
    REQUIRE(h.size() == 200);
    REQUIRE(h.getSeeds() == adapter.getCalls());
    for (size_t i = 0; i < h.size(); ++i)
    {
        REQUIRE(h.getHashes()[i] == h.getSeeds()[i] % 1000);
    }
}

TEST_CASE("fuzz loop seeds come from a seeded mt19937_64", "[fuzz]")
{
    FakeAdapter adapter(succeedWith([](uint64_t s) { return s; }));
    CardinalityEstimator est;
    FuzzLoop(adapter, est).run(5, 12345);

    std::mt19937_64 engine(12345);
    for (auto s : adapter.getCalls())
    {
        REQUIRE(s == engine());
    }
}

TEST_CASE("fuzz loop is reproducible from its initial seed", "[fuzz]")
{
    auto hash = [](uint64_t s) { return s ^ (s >> 7); };
    FakeAdapter a(succeedWith(hash));
    FakeAdapter b(succeedWith(hash));
    CardinalityEstimator ea;
    CardinalityEstimator eb;
    FuzzLoop(a, ea).run(100, 99);
    FuzzLoop(b, eb).run(100, 99);
    REQUIRE(ea == eb);

    SECTION("and picks a fresh seed when none is given")
    {
        FakeAdapter c(succeedWith(hash));
        CardinalityEstimator ec;
        auto report = FuzzLoop(c, ec).run(3);
        std::mt19937_64 engine(report.mEngineSeed);
        REQUIRE(c.getCalls().front() == engine());
    }
}

TEST_CASE("fuzz loop skips failures", "[fuzz]")
{
    // Every other invocation fails with the sentinel diagnostic.
    int n = 0;
    FakeAdapter adapter([&n](uint64_t seed) {
        if (n++ % 2 == 1)
        {
            return ExecutionOutcome::failure("stdout:\n\nstderr:\nno\n");
        }
        return ExecutionOutcome::success(seed);
    });
    CardinalityEstimator est;
    auto report = FuzzLoop(adapter, est).run(10, 1);
    REQUIRE(report.mSuccesses == 5);
    REQUIRE(report.mFailures == 5);
    REQUIRE(est.getHistory().size() == 5);
    for (size_t i = 0; i < 5; ++i)
    {
        REQUIRE(est.getHistory().getSeeds()[i] == adapter.getCalls()[2 * i]);
    }
}

TEST_CASE("fuzz loop with zero iterations", "[fuzz]")
{
    FakeAdapter adapter(succeedWith([](uint64_t s) { return s; }));
    CardinalityEstimator est;
    est.add(1, 2);
    auto before = est;
    auto report = FuzzLoop(adapter, est).run(0, 3);
    REQUIRE(adapter.getCalls().empty());
    REQUIRE(est == before);
    REQUIRE(report.mIterations == 0);
    REQUIRE(report.mStartCount == report.mEndCount);
}

TEST_CASE("fuzz loop count never decreases", "[fuzz]")
{
    FakeAdapter adapter(succeedWith([](uint64_t s) { return s; }));
    CardinalityEstimator est(8);
    FuzzLoop loop(adapter, est, 10);
    double prev = est.count();
    for (uint64_t round = 0; round < 20; ++round)
    {
        auto report = loop.run(50, round);
        REQUIRE(report.mStartCount == prev);
        REQUIRE(report.mEndCount >= report.mStartCount);
        prev = report.mEndCount;
    }
    REQUIRE(est.getHistory().size() == 1000);
}

TEST_CASE("replay verifier", "[verify]")
{
    auto hash = [](uint64_t s) { return s * 3 + 1; };
    FakeAdapter recorder(succeedWith(hash));
    CardinalityEstimator est;
    FuzzLoop(recorder, est).run(50, 5);

    SECTION("passes on a deterministic target")
    {
        FakeAdapter replay(succeedWith(hash));
        REQUIRE(ReplayVerifier(replay).verify(est) == 50);
        REQUIRE(replay.getCalls() == est.getHistory().getSeeds());
    }
    SECTION("passes trivially on an empty history")
    {
        FakeAdapter replay(succeedWith(hash));
        REQUIRE(ReplayVerifier(replay).verify(CardinalityEstimator()) == 0);
        REQUIRE(replay.getCalls().empty());
    }
    SECTION("replays recorded duplicates in order")
    {
        CardinalityEstimator dup;
        dup.add(9, hash(9));
        dup.add(4, hash(4));
        dup.add(9, hash(9));
        FakeAdapter replay(succeedWith(hash));
        REQUIRE(ReplayVerifier(replay).verify(dup) == 3);
        REQUIRE(replay.getCalls() == std::vector<uint64_t>{9, 4, 9});
    }
    SECTION("stops at the first divergent hash")
    {
        auto const& seeds = est.getHistory().getSeeds();
        auto bad = seeds[17];
        FakeAdapter replay([&](uint64_t s) {
            return ExecutionOutcome::success(s == bad ? hash(s) + 1
                                                      : hash(s));
        });
        try
        {
            ReplayVerifier(replay).verify(est);
            FAIL("expected VerificationMismatch");
        }
        catch (VerificationMismatch const& e)
        {
            REQUIRE(e.getIndex() == 17);
            REQUIRE(e.getSeed() == bad);
            REQUIRE(e.getExpected() == hash(bad));
            REQUIRE(e.getActual() ==
                    ExecutionOutcome::success(hash(bad) + 1));
        }
        REQUIRE(replay.getCalls().size() == 18);
    }
    SECTION("treats a failure as divergence")
    {
        FakeAdapter replay(
            [](uint64_t) { return ExecutionOutcome::failure("crashed"); });
        REQUIRE_THROWS_AS(ReplayVerifier(replay).verify(est),
                          VerificationMismatch);
        REQUIRE(replay.getCalls().size() == 1);
    }
}

TEST_CASE("verify fails on the first pair without further calls", "[verify]")
{
    CardinalityEstimator est;
    est.add(42, 100);
    est.add(43, 200);
    FakeAdapter replay(replayTable({{42, 101}, {43, 200}}));
    try
    {
        ReplayVerifier(replay).verify(est);
        FAIL("expected VerificationMismatch");
    }
    catch (VerificationMismatch const& e)
    {
        REQUIRE(e.getIndex() == 0);
        REQUIRE(e.getSeed() == 42);
        REQUIRE(e.getExpected() == 100);
        REQUIRE(e.getActual() == ExecutionOutcome::success(101));
        REQUIRE(std::string(e.what()).find("seed 42") != std::string::npos);
    }
    REQUIRE(replay.getCalls() == std::vector<uint64_t>{42});
}
