#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "execution/ExecutionOutcome.h"
#include "util/NonCopyable.h"

#include <cstdint>
#include <string>

namespace potfuzz
{

// Runs a target's entry point on one seed at a time. Implementations report
// target misbehaviour as a Failure outcome and throw only when the harness
// itself cannot carry out the call.
class ExecutionAdapter : public NonMovableOrCopyable
{
  public:
    virtual ~ExecutionAdapter() = default;

    virtual ExecutionOutcome invoke(uint64_t seed) = 0;

    // Path of the target this adapter runs.
    virtual std::string const& getTarget() const = 0;
};
}
