#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "execution/ExecutionAdapter.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <sys/types.h>

namespace potfuzz
{

class OutputCapture;

// Runs targets built as shared objects exporting
//
//     extern "C" uint64_t test(uint64_t seed);
//
// (the symbol name is configurable). The module is checked once, up front, so
// a bad target is rejected before any seed is drawn. Each invocation then
// runs in a potfuzz-runner process started with posix_spawn(), so crashes,
// hangs, exit() calls and stray writes to stdout/stderr stay out of the
// harness; the child's output is captured and returned as the diagnostic of
// a Failure.
class SharedObjectAdapter : public ExecutionAdapter
{
    std::string const mTarget;
    std::string const mEntryPointName;
    std::chrono::milliseconds const mTimeout;
    std::string mLoadPath;
    std::string mRunner;

    void checkTarget() const;
    pid_t spawnRunner(uint64_t seed, OutputCapture& capture) const;
    ExecutionOutcome waitForChild(pid_t pid, OutputCapture& capture);

  public:
    static constexpr char const* DEFAULT_ENTRY_POINT = "test";

    // Throws AdapterConstructionError if the file is missing, is not a
    // loadable module, lacks the entry point, or if `runner` names a file
    // that does not exist. A zero timeout waits for the child indefinitely.
    // An empty `runner` means defaultRunnerPath().
    SharedObjectAdapter(std::string const& target,
                        std::string const& entryPoint = DEFAULT_ENTRY_POINT,
                        std::chrono::milliseconds timeout =
                            std::chrono::milliseconds::zero(),
                        std::string const& runner = "");

    ExecutionOutcome invoke(uint64_t seed) override;

    std::string const&
    getTarget() const override
    {
        return mTarget;
    }

    std::string const&
    getRunner() const
    {
        return mRunner;
    }

    // potfuzz-runner next to the running executable if present, otherwise
    // the bare name, looked up on PATH.
    static std::string defaultRunnerPath();
};
}
