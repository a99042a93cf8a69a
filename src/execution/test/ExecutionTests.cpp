// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "execution/ExecutionError.h"
#include "execution/SharedObjectAdapter.h"
#include "execution/test/TestTarget.h"
#include "test/Catch2.h"
#include "test/test.h"
#include "util/Fs.h"
#include "util/TmpDir.h"

#include <chrono>
#include <fstream>
#include <future>
#include <memory>
#include <thread>

using namespace potfuzz;
using namespace potfuzz::testtarget;

namespace
{
std::unique_ptr<SharedObjectAdapter>
testAdapter(std::chrono::milliseconds timeout,
            std::string const& entryPoint = "test")
{
    return std::make_unique<SharedObjectAdapter>(
        getTestTargetPath(), entryPoint, timeout, getTestRunnerPath());
}
}

TEST_CASE("execution outcome alternatives", "[execution]")
{
    auto s = ExecutionOutcome::success(42);
    auto f = ExecutionOutcome::failure("boom");

    REQUIRE(s.isSuccess());
    REQUIRE(s.getHash() == 42);
    REQUIRE_THROWS_AS(s.getDiagnostic(), std::logic_error);
    REQUIRE(s.toString() == "Success(42)");

    REQUIRE(!f.isSuccess());
    REQUIRE(f.getDiagnostic() == "boom");
    REQUIRE_THROWS_AS(f.getHash(), std::logic_error);
    REQUIRE(f.toString() == "Failure(boom)");

    REQUIRE(s == ExecutionOutcome::success(42));
    REQUIRE(!(s == ExecutionOutcome::success(43)));
    REQUIRE(!(s == f));
}

TEST_CASE("shared object adapter construction", "[execution]")
{
    TmpDir dir(getTestTmpRoot() + "/adapter");

    SECTION("missing file")
    {
        REQUIRE_THROWS_AS(SharedObjectAdapter(dir.getName() + "/absent.so"),
                          AdapterConstructionError);
    }
    SECTION("file that is not a module")
    {
        auto path = dir.getName() + "/garbage.so";
        std::ofstream(path) << "definitely not ELF";
        REQUIRE_THROWS_AS(SharedObjectAdapter(path), AdapterConstructionError);
    }
    SECTION("module without the entry point")
    {
        REQUIRE_THROWS_AS(SharedObjectAdapter(getTestTargetNoEntryPath()),
                          AdapterConstructionError);
    }
    SECTION("module with a custom entry point")
    {
        REQUIRE_THROWS_AS(
            SharedObjectAdapter(getTestTargetPath(), "no_such_symbol"),
            AdapterConstructionError);
        auto adapter = testAdapter(std::chrono::milliseconds(5000),
                                   "alt_entry");
        REQUIRE(adapter->invoke(41) == ExecutionOutcome::success(42));
        REQUIRE(adapter->getTarget() == getTestTargetPath());
    }
    SECTION("missing runner")
    {
        REQUIRE_THROWS_AS(
            SharedObjectAdapter(getTestTargetPath(), "test",
                                std::chrono::milliseconds(0),
                                dir.getName() + "/no-runner"),
            AdapterConstructionError);
    }
    SECTION("runner defaults to the one beside the executable")
    {
        SharedObjectAdapter adapter(getTestTargetPath());
        REQUIRE(adapter.getRunner() ==
                SharedObjectAdapter::defaultRunnerPath());
        REQUIRE(adapter.getRunner().find("potfuzz-runner") !=
                std::string::npos);
    }
}

TEST_CASE("shared object adapter outcomes", "[execution]")
{
    auto adapterPtr = testAdapter(std::chrono::milliseconds(5000));
    auto& adapter = *adapterPtr;

    SECTION("ordinary seeds succeed deterministically")
    {
        for (uint64_t seed : {0ULL, 100ULL, 12345678901ULL, ~0ULL})
        {
            auto first = adapter.invoke(seed);
            REQUIRE(first == ExecutionOutcome::success(expectedHash(seed)));
            REQUIRE(adapter.invoke(seed) == first);
        }
    }
    SECTION("sentinel is a failure carrying captured output")
    {
        auto out = adapter.invoke(SEED_SENTINEL);
        REQUIRE(!out.isSuccess());
        REQUIRE(out.getDiagnostic() ==
                "stdout:\nrejected seed 1\n\nstderr:\nsentinel path\n");
    }
    SECTION("crash is a failure naming the signal")
    {
        auto out = adapter.invoke(SEED_ABORT);
        REQUIRE(!out.isSuccess());
        auto const& d = out.getDiagnostic();
        REQUIRE(d.find("target terminated by signal 6") == 0);
        REQUIRE(d.find("about to abort") != std::string::npos);
    }
    SECTION("exit without a value is a failure")
    {
        auto out = adapter.invoke(SEED_EXIT);
        REQUIRE(!out.isSuccess());
        REQUIRE(out.getDiagnostic().find(
                    "target exited with status 7 without returning a value") ==
                0);
    }
    SECTION("large output is drained")
    {
        REQUIRE(adapter.invoke(SEED_NOISY) ==
                ExecutionOutcome::success(expectedHash(SEED_NOISY)));
    }
    SECTION("adapter keeps working after failures")
    {
        adapter.invoke(SEED_ABORT);
        adapter.invoke(SEED_SENTINEL);
        REQUIRE(adapter.invoke(7) ==
                ExecutionOutcome::success(expectedHash(7)));
    }
}

TEST_CASE("shared object adapter timeout", "[execution]")
{
    auto adapter = testAdapter(std::chrono::milliseconds(200));
    auto out = adapter->invoke(SEED_HANG);
    REQUIRE(!out.isSuccess());
    REQUIRE(out.getDiagnostic().find("target timed out after 200 ms") == 0);
    REQUIRE(adapter->invoke(8) == ExecutionOutcome::success(expectedHash(8)));
}

TEST_CASE("target exit returns promptly without a timeout", "[execution]")
{
    // The invocation runs on a detached thread so a hang fails the test
    // instead of blocking the whole run.
    std::shared_ptr<SharedObjectAdapter> adapter =
        testAdapter(std::chrono::milliseconds::zero());
    auto done = std::make_shared<std::promise<ExecutionOutcome>>();
    auto result = done->get_future();
    std::thread([adapter, done]() {
        try
        {
            done->set_value(adapter->invoke(SEED_EXIT));
        }
        catch (std::exception&)
        {
            done->set_exception(std::current_exception());
        }
    }).detach();

    REQUIRE(result.wait_for(std::chrono::seconds(30)) ==
            std::future_status::ready);
    auto out = result.get();
    REQUIRE(!out.isSuccess());
    REQUIRE(out.getDiagnostic().find(
                "target exited with status 7 without returning a value") == 0);

    // exit() in the target must not run this process's exit handlers.
    REQUIRE(fs::exists(getTestTmpRoot()));
    REQUIRE(adapter->invoke(9) == ExecutionOutcome::success(expectedHash(9)));
}
