// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "execution/PosixSpawnFileActions.h"
#include "execution/ExecutionError.h"
#include "util/Logging.h"

#include <cstring>
#include <fmt/format.h>

namespace potfuzz
{

PosixSpawnFileActions::~PosixSpawnFileActions()
{
    if (mInitialized)
    {
        if (auto err = posix_spawn_file_actions_destroy(&mFileActions))
        {
            CLOG_ERROR(Exec, "posix_spawn_file_actions_destroy() failed: {}",
                       std::strerror(err));
        }
    }
}

void
PosixSpawnFileActions::initialize()
{
    if (mInitialized)
    {
        return;
    }

    if (auto err = posix_spawn_file_actions_init(&mFileActions))
    {
        throw ExecutionTransportError(
            fmt::format(FMT_STRING("posix_spawn_file_actions_init() failed: {}"),
                        std::strerror(err)));
    }
    mInitialized = true;
}

void
PosixSpawnFileActions::addOpen(int fildes, std::string const& fileName,
                               int oflag, mode_t mode)
{
    initialize();

    if (auto err = posix_spawn_file_actions_addopen(
            &mFileActions, fildes, fileName.c_str(), oflag, mode))
    {
        throw ExecutionTransportError(fmt::format(
            FMT_STRING("posix_spawn_file_actions_addopen() failed: {}"),
            std::strerror(err)));
    }
}

void
PosixSpawnFileActions::addDup2(int fildes, int newFildes)
{
    initialize();

    if (auto err =
            posix_spawn_file_actions_adddup2(&mFileActions, fildes, newFildes))
    {
        throw ExecutionTransportError(fmt::format(
            FMT_STRING("posix_spawn_file_actions_adddup2() failed: {}"),
            std::strerror(err)));
    }
}

PosixSpawnFileActions::operator posix_spawn_file_actions_t*()
{
    return mInitialized ? &mFileActions : nullptr;
}
}
