// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

// potfuzz-runner: runs one target invocation in a fresh process image so the
// target never shares threads, stdio buffers or exit handlers with the
// harness.

#include "execution/RunnerProtocol.h"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <dlfcn.h>
#include <exception>
#include <fmt/format.h>
#include <string>
#include <unistd.h>

using namespace potfuzz;

namespace
{
bool
writeResult(uint64_t value)
{
    char const* p = reinterpret_cast<char const*>(&value);
    size_t left = sizeof(value);
    while (left > 0)
    {
        auto n = ::write(runner::RESULT_FD, p, left);
        if (n == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    ::close(runner::RESULT_FD);
    return true;
}
}

int
main(int argc, char* const* argv)
{
    if (argc != 4)
    {
        fmt::print(stderr, "usage: {} TARGET ENTRY-POINT SEED\n",
                   runner::EXECUTABLE_NAME);
        return runner::EXIT_USAGE;
    }

    uint64_t seed;
    try
    {
        seed = std::stoull(argv[3]);
    }
    catch (std::exception& e)
    {
        fmt::print(stderr, "{}: bad seed '{}': {}\n", runner::EXECUTABLE_NAME,
                   argv[3], e.what());
        return runner::EXIT_USAGE;
    }

    void* handle = ::dlopen(argv[1], RTLD_NOW | RTLD_LOCAL);
    if (!handle)
    {
        char const* err = ::dlerror();
        fmt::print(stderr, "{}: could not load '{}': {}\n",
                   runner::EXECUTABLE_NAME, argv[1],
                   err ? err : "unknown error");
        return runner::EXIT_LOAD_FAILED;
    }
    ::dlerror();
    void* sym = ::dlsym(handle, argv[2]);
    if (::dlerror() || !sym)
    {
        fmt::print(stderr, "{}: '{}' does not export '{}'\n",
                   runner::EXECUTABLE_NAME, argv[1], argv[2]);
        return runner::EXIT_LOAD_FAILED;
    }

    auto entryPoint = reinterpret_cast<uint64_t (*)(uint64_t)>(sym);
    uint64_t result = entryPoint(seed);

    std::fflush(nullptr);
    if (!writeResult(result))
    {
        return runner::EXIT_RESULT_WRITE_FAILED;
    }
    return 0;
}
