// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "execution/OutputCapture.h"
#include "execution/ExecutionError.h"
#include "execution/PosixSpawnFileActions.h"
#include "execution/RunnerProtocol.h"
#include "util/Logging.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <poll.h>
#include <unistd.h>

namespace potfuzz
{

void
OutputCapture::openPipe(Pipe& p, char const* name)
{
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0)
    {
        throw ExecutionTransportError(
            fmt::format(FMT_STRING("pipe() for {} failed: {}"), name,
                        std::strerror(errno)));
    }
    p.mRead = fds[0];
    p.mWrite = fds[1];
    p.mOpen = true;
    moveAboveResultFd(p.mRead, name);
    moveAboveResultFd(p.mWrite, name);
}

// A pipe end sitting on a descriptor the child's dup2() targets would keep
// O_CLOEXEC (or be clobbered), so every end is kept above runner::RESULT_FD.
void
OutputCapture::moveAboveResultFd(int& fd, char const* name)
{
    if (fd > runner::RESULT_FD)
    {
        return;
    }
    int moved = ::fcntl(fd, F_DUPFD_CLOEXEC, runner::RESULT_FD + 1);
    if (moved == -1)
    {
        throw ExecutionTransportError(
            fmt::format(FMT_STRING("fcntl() for {} pipe failed: {}"), name,
                        std::strerror(errno)));
    }
    ::close(fd);
    fd = moved;
}

void
OutputCapture::closeFd(int& fd)
{
    if (fd != -1)
    {
        // The descriptor is released even when close() reports EINTR.
        ::close(fd);
        fd = -1;
    }
}

OutputCapture::OutputCapture()
{
    try
    {
        openPipe(mStdout, "stdout");
        openPipe(mStderr, "stderr");
        openPipe(mResult, "result");
    }
    catch (ExecutionTransportError&)
    {
        for (auto p : {&mStdout, &mStderr, &mResult})
        {
            closeFd(p->mRead);
            closeFd(p->mWrite);
        }
        throw;
    }
}

OutputCapture::~OutputCapture()
{
    for (auto p : {&mStdout, &mStderr, &mResult})
    {
        closeFd(p->mRead);
        closeFd(p->mWrite);
    }
}

void
OutputCapture::addChildRedirects(PosixSpawnFileActions& actions) const
{
    actions.addOpen(STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    actions.addDup2(mStdout.mWrite, STDOUT_FILENO);
    actions.addDup2(mStderr.mWrite, STDERR_FILENO);
    actions.addDup2(mResult.mWrite, runner::RESULT_FD);
}

void
OutputCapture::closeChildEnds()
{
    closeFd(mStdout.mWrite);
    closeFd(mStderr.mWrite);
    closeFd(mResult.mWrite);
}

bool
OutputCapture::drain(
    std::optional<std::chrono::steady_clock::time_point> deadline)
{
    using namespace std::chrono;
    Pipe* pipes[] = {&mStdout, &mStderr, &mResult};
    std::string* sinks[] = {&mStdoutData, &mStderrData, &mResultData};
    char buf[4096];

    for (;;)
    {
        struct pollfd fds[3];
        size_t idx[3];
        nfds_t n = 0;
        for (size_t i = 0; i < 3; ++i)
        {
            if (pipes[i]->mOpen)
            {
                fds[n].fd = pipes[i]->mRead;
                fds[n].events = POLLIN;
                fds[n].revents = 0;
                idx[n] = i;
                ++n;
            }
        }
        if (n == 0)
        {
            return true;
        }

        int timeout = -1;
        if (deadline)
        {
            auto left = duration_cast<milliseconds>(*deadline -
                                                    steady_clock::now());
            if (left.count() <= 0)
            {
                return false;
            }
            timeout = static_cast<int>(left.count());
        }

        int rc = ::poll(fds, n, timeout);
        if (rc == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw ExecutionTransportError(fmt::format(
                FMT_STRING("poll() failed: {}"), std::strerror(errno)));
        }
        if (rc == 0)
        {
            continue;
        }

        for (nfds_t k = 0; k < n; ++k)
        {
            if (fds[k].revents == 0)
            {
                continue;
            }
            auto i = idx[k];
            auto r = ::read(fds[k].fd, buf, sizeof(buf));
            if (r == -1)
            {
                if (errno == EINTR || errno == EAGAIN)
                {
                    continue;
                }
                throw ExecutionTransportError(fmt::format(
                    FMT_STRING("read() failed: {}"), std::strerror(errno)));
            }
            if (r == 0)
            {
                pipes[i]->mOpen = false;
                closeFd(pipes[i]->mRead);
            }
            else
            {
                sinks[i]->append(buf, static_cast<size_t>(r));
            }
        }
    }
}

std::optional<uint64_t>
OutputCapture::getResult() const
{
    if (mResultData.size() != sizeof(uint64_t))
    {
        return std::nullopt;
    }
    uint64_t v;
    std::memcpy(&v, mResultData.data(), sizeof(v));
    return v;
}

std::string
OutputCapture::describe() const
{
    return fmt::format(FMT_STRING("stdout:\n{}\nstderr:\n{}"), mStdoutData,
                       mStderrData);
}
}
