#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstdint>
#include <limits>
#include <string>
#include <variant>

namespace potfuzz
{

// A target returning this value reports that the seed was rejected or that
// its own checks failed; the invocation counts as a failure.
constexpr uint64_t FAILURE_SENTINEL = std::numeric_limits<uint64_t>::max();

struct ExecutionSuccess
{
    uint64_t mHash;
};

struct ExecutionFailure
{
    std::string mDiagnostic;
};

// Result of one invocation of a target.
class ExecutionOutcome
{
    std::variant<ExecutionSuccess, ExecutionFailure> mValue;

    explicit ExecutionOutcome(ExecutionSuccess s);
    explicit ExecutionOutcome(ExecutionFailure f);

  public:
    static ExecutionOutcome success(uint64_t hash);
    static ExecutionOutcome failure(std::string diagnostic);

    bool isSuccess() const;

    // Throws std::logic_error when called on the wrong alternative.
    uint64_t getHash() const;
    std::string const& getDiagnostic() const;

    std::string toString() const;

    bool operator==(ExecutionOutcome const& other) const;
};
}
