#pragma once

// Copyright 2017 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

// Always include this file instead of catch2/catch.hpp in order to get access
// to Catch2.
// This is necessary for the StringMaker specializations to work properly
// without violating the one definition rule.
// Define any StringMaker specialzations here for pretty printing the custom
// types.

#include "execution/ExecutionOutcome.h"

#include <catch2/catch.hpp>

namespace Catch
{
template <> struct StringMaker<potfuzz::ExecutionOutcome>
{
    static std::string
    convert(potfuzz::ExecutionOutcome const& outcome)
    {
        return outcome.toString();
    }
};
}
