// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "execution/ExecutionOutcome.h"

#include <fmt/format.h>
#include <stdexcept>

namespace potfuzz
{

ExecutionOutcome::ExecutionOutcome(ExecutionSuccess s) : mValue(s)
{
}

ExecutionOutcome::ExecutionOutcome(ExecutionFailure f) : mValue(std::move(f))
{
}

ExecutionOutcome
ExecutionOutcome::success(uint64_t hash)
{
    return ExecutionOutcome(ExecutionSuccess{hash});
}

ExecutionOutcome
ExecutionOutcome::failure(std::string diagnostic)
{
    return ExecutionOutcome(ExecutionFailure{std::move(diagnostic)});
}

bool
ExecutionOutcome::isSuccess() const
{
    return std::holds_alternative<ExecutionSuccess>(mValue);
}

uint64_t
ExecutionOutcome::getHash() const
{
    if (auto s = std::get_if<ExecutionSuccess>(&mValue))
    {
        return s->mHash;
    }
    throw std::logic_error("getHash() on failed execution outcome");
}

std::string const&
ExecutionOutcome::getDiagnostic() const
{
    if (auto f = std::get_if<ExecutionFailure>(&mValue))
    {
        return f->mDiagnostic;
    }
    throw std::logic_error("getDiagnostic() on successful execution outcome");
}

std::string
ExecutionOutcome::toString() const
{
    if (isSuccess())
    {
        return fmt::format(FMT_STRING("Success({})"), getHash());
    }
    return fmt::format(FMT_STRING("Failure({})"), getDiagnostic());
}

bool
ExecutionOutcome::operator==(ExecutionOutcome const& other) const
{
    if (isSuccess() != other.isSuccess())
    {
        return false;
    }
    return isSuccess() ? getHash() == other.getHash()
                       : getDiagnostic() == other.getDiagnostic();
}
}
