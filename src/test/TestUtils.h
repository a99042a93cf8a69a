#pragma once

// Copyright 2016 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "execution/ExecutionAdapter.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace potfuzz
{

namespace testutil
{

// In-process adapter whose behaviour is a plain function of the seed.
// Records every seed it is invoked on.
class FakeAdapter : public ExecutionAdapter
{
  public:
    using Behaviour = std::function<ExecutionOutcome(uint64_t)>;

  private:
    std::string const mTarget;
    Behaviour mBehaviour;
    std::vector<uint64_t> mCalls;

  public:
    explicit FakeAdapter(Behaviour behaviour,
                         std::string const& target = "fake-target");

    ExecutionOutcome invoke(uint64_t seed) override;

    std::string const&
    getTarget() const override
    {
        return mTarget;
    }

    std::vector<uint64_t> const&
    getCalls() const
    {
        return mCalls;
    }

    void
    setBehaviour(Behaviour behaviour)
    {
        mBehaviour = std::move(behaviour);
    }
};

// Returns `hash(seed)` for every seed.
FakeAdapter::Behaviour succeedWith(std::function<uint64_t(uint64_t)> hash);

// Returns the recorded value for known seeds and a failure otherwise.
FakeAdapter::Behaviour
replayTable(std::map<uint64_t, uint64_t> const& table);

// Sets an environment variable for the lifetime of the object and restores
// the previous value afterwards.
class ScopedEnv
{
    std::string const mName;
    bool mHadValue{false};
    std::string mOldValue;

  public:
    ScopedEnv(std::string const& name, std::string const& value);
    ~ScopedEnv();
};
}
}
