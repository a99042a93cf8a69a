#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

// Contract between SharedObjectAdapter and the potfuzz-runner executable it
// spawns for every invocation:
//
//     potfuzz-runner TARGET ENTRY-POINT SEED
//
// The runner loads TARGET, calls ENTRY-POINT(SEED) and writes the 8-byte
// result, in host byte order, to RESULT_FD before exiting with status 0.

namespace potfuzz
{
namespace runner
{
constexpr char const* EXECUTABLE_NAME = "potfuzz-runner";

// First descriptor above stderr; the adapter dup2()s the result pipe here.
constexpr int RESULT_FD = 3;

// Exit statuses for failures of the runner itself.
constexpr int EXIT_USAGE = 120;
constexpr int EXIT_LOAD_FAILED = 121;
constexpr int EXIT_RESULT_WRITE_FAILED = 122;
}
}
