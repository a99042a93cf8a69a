#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/NonCopyable.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace potfuzz
{

class PosixSpawnFileActions;

// Pipes connecting one spawned invocation back to the harness: the child's
// stdout, its stderr, and a private channel carrying the 8-byte return
// value. Created before the spawn and closed on destruction, so nothing is
// shared between invocations.
class OutputCapture : public NonMovableOrCopyable
{
    struct Pipe
    {
        int mRead{-1};
        int mWrite{-1};
        bool mOpen{false};
    };

    Pipe mStdout;
    Pipe mStderr;
    Pipe mResult;

    std::string mStdoutData;
    std::string mStderrData;
    std::string mResultData;

    static void openPipe(Pipe& p, char const* name);
    static void moveAboveResultFd(int& fd, char const* name);
    static void closeFd(int& fd);

  public:
    // Throws ExecutionTransportError if a pipe cannot be created.
    OutputCapture();
    ~OutputCapture();

    // Child side: stdin from /dev/null, stdout and stderr into the capture
    // pipes, and the result pipe on runner::RESULT_FD.
    void addChildRedirects(PosixSpawnFileActions& actions) const;

    // Parent side: drop the write ends inherited by the child.
    void closeChildEnds();

    // Parent side: read all three pipes until the child closes them or the
    // deadline passes. Returns false on timeout. Throws
    // ExecutionTransportError if poll() or read() fails.
    bool drain(std::optional<std::chrono::steady_clock::time_point> deadline);

    std::string const&
    getStdout() const
    {
        return mStdoutData;
    }

    std::string const&
    getStderr() const
    {
        return mStderrData;
    }

    // The value the child wrote, if it wrote a complete one.
    std::optional<uint64_t> getResult() const;

    // "stdout:\n<captured>\nstderr:\n<captured>"
    std::string describe() const;
};
}
