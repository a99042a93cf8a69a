#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/NonCopyable.h"

#include <string>

#include <spawn.h>
#include <sys/types.h>

namespace potfuzz
{

// Owns a posix_spawn_file_actions_t. Each add* throws
// ExecutionTransportError if libc rejects the action.
class PosixSpawnFileActions : public NonMovableOrCopyable
{
  public:
    PosixSpawnFileActions() = default;
    ~PosixSpawnFileActions();

    void addOpen(int fildes, std::string const& fileName, int oflag,
                 mode_t mode);
    void addDup2(int fildes, int newFildes);

    operator posix_spawn_file_actions_t*();

  private:
    posix_spawn_file_actions_t mFileActions;
    bool mInitialized{false};

    void initialize();
};
}
