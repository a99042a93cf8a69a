// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "execution/SharedObjectAdapter.h"
#include "execution/ExecutionError.h"
#include "execution/OutputCapture.h"
#include "execution/PosixSpawnFileActions.h"
#include "execution/RunnerProtocol.h"
#include "util/Fs.h"
#include "util/Logging.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <dlfcn.h>
#include <fcntl.h>
#include <filesystem>
#include <fmt/format.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace potfuzz
{

namespace
{
pid_t
reapChild(pid_t pid, int& status)
{
    pid_t r;
    while ((r = ::waitpid(pid, &status, 0)) == -1 && errno == EINTR)
    {
    }
    return r;
}

// Set FD_CLOEXEC on every descriptor above stderr so the runner inherits
// only what the file actions hand it.
void
closeInheritedFdsOnExec()
{
    long const maxFds = ::sysconf(_SC_OPEN_MAX);
    // Stop after a long run of unused descriptors; there is no portable way
    // to enumerate the open ones.
    int const maxGap = 512;
    for (int fd = 3, lastFd = 3; (fd < maxFds) && ((fd - lastFd) < maxGap);
         ++fd)
    {
        int flags = ::fcntl(fd, F_GETFD);
        if (flags != -1)
        {
            if ((flags & FD_CLOEXEC) == 0)
            {
                ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
            }
            lastFd = fd;
        }
    }
}
}

SharedObjectAdapter::SharedObjectAdapter(std::string const& target,
                                         std::string const& entryPoint,
                                         std::chrono::milliseconds timeout,
                                         std::string const& runner)
    : mTarget(target)
    , mEntryPointName(entryPoint)
    , mTimeout(timeout)
    , mLoadPath(target)
    , mRunner(runner.empty() ? defaultRunnerPath() : runner)
{
    if (!fs::exists(mTarget))
    {
        throw AdapterConstructionError(
            fmt::format(FMT_STRING("target '{}' does not exist"), mTarget));
    }

    // dlopen only searches the library path for names without a slash.
    if (mLoadPath.find('/') == std::string::npos)
    {
        mLoadPath = "./" + mLoadPath;
    }

    if (mRunner.find('/') != std::string::npos && !fs::exists(mRunner))
    {
        throw AdapterConstructionError(
            fmt::format(FMT_STRING("runner '{}' does not exist"), mRunner));
    }

    checkTarget();
    CLOG_DEBUG(Exec, "Target {} (entry point {}) runs through {}", mTarget,
               mEntryPointName, mRunner);
}

void
SharedObjectAdapter::checkTarget() const
{
    void* handle = ::dlopen(mLoadPath.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle)
    {
        char const* err = ::dlerror();
        throw AdapterConstructionError(
            fmt::format(FMT_STRING("could not load target '{}': {}"), mTarget,
                        err ? err : "unknown error"));
    }

    ::dlerror();
    void* sym = ::dlsym(handle, mEntryPointName.c_str());
    char const* err = ::dlerror();
    ::dlclose(handle);
    if (err || !sym)
    {
        throw AdapterConstructionError(fmt::format(
            FMT_STRING("target '{}' does not export entry point '{}'"),
            mTarget, mEntryPointName));
    }
}

std::string
SharedObjectAdapter::defaultRunnerPath()
{
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec)
    {
        auto sibling = self.parent_path() / runner::EXECUTABLE_NAME;
        if (fs::exists(sibling.string()))
        {
            return sibling.string();
        }
    }
    return runner::EXECUTABLE_NAME;
}

pid_t
SharedObjectAdapter::spawnRunner(uint64_t seed, OutputCapture& capture) const
{
    std::vector<std::string> args{mRunner, mLoadPath, mEntryPointName,
                                  std::to_string(seed)};
    std::vector<char*> argv;
    for (auto& a : args)
    {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    PosixSpawnFileActions fileActions;
    capture.addChildRedirects(fileActions);
    closeInheritedFdsOnExec();

    pid_t pid;
    int err = ::posix_spawnp(&pid, argv[0], fileActions,
                             nullptr, // posix_spawnattr_t*
                             argv.data(), environ);
    if (err)
    {
        throw ExecutionTransportError(
            fmt::format(FMT_STRING("posix_spawn() of '{}' failed: {}"),
                        mRunner, std::strerror(err)));
    }
    return pid;
}

ExecutionOutcome
SharedObjectAdapter::invoke(uint64_t seed)
{
    OutputCapture capture;
    pid_t pid = spawnRunner(seed, capture);
    capture.closeChildEnds();
    CLOG_TRACE(Exec, "Invoking {} on seed {} in pid {}", mTarget, seed, pid);
    return waitForChild(pid, capture);
}

ExecutionOutcome
SharedObjectAdapter::waitForChild(pid_t pid, OutputCapture& capture)
{
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (mTimeout.count() > 0)
    {
        deadline = std::chrono::steady_clock::now() + mTimeout;
    }

    bool finished;
    try
    {
        finished = capture.drain(deadline);
    }
    catch (ExecutionTransportError&)
    {
        int ignored;
        ::kill(pid, SIGKILL);
        reapChild(pid, ignored);
        throw;
    }

    int status = 0;
    if (!finished)
    {
        ::kill(pid, SIGKILL);
        if (reapChild(pid, status) == -1)
        {
            throw ExecutionTransportError(fmt::format(
                FMT_STRING("waitpid() failed: {}"), std::strerror(errno)));
        }
        CLOG_DEBUG(Exec, "Killed pid {} after {} ms", pid, mTimeout.count());
        return ExecutionOutcome::failure(
            fmt::format(FMT_STRING("target timed out after {} ms\n{}"),
                        mTimeout.count(), capture.describe()));
    }

    if (reapChild(pid, status) == -1)
    {
        throw ExecutionTransportError(fmt::format(
            FMT_STRING("waitpid() failed: {}"), std::strerror(errno)));
    }

    if (WIFSIGNALED(status))
    {
        int sig = WTERMSIG(status);
        char const* name = ::strsignal(sig);
        return ExecutionOutcome::failure(fmt::format(
            FMT_STRING("target terminated by signal {} ({})\n{}"), sig,
            name ? name : "unknown", capture.describe()));
    }

    auto result = capture.getResult();
    if (WIFEXITED(status) && WEXITSTATUS(status) == 0 && result)
    {
        if (*result == FAILURE_SENTINEL)
        {
            return ExecutionOutcome::failure(capture.describe());
        }
        return ExecutionOutcome::success(*result);
    }

    return ExecutionOutcome::failure(fmt::format(
        FMT_STRING("target exited with status {} without returning a "
                   "value\n{}"),
        WIFEXITED(status) ? WEXITSTATUS(status) : -1, capture.describe()));
}
}
