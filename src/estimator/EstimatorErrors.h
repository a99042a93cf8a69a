#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <stdexcept>
#include <string>

namespace potfuzz
{

class InvalidPrecision : public std::invalid_argument
{
  public:
    explicit InvalidPrecision(std::string const& msg)
        : std::invalid_argument(msg)
    {
    }
};

class PrecisionMismatch : public std::invalid_argument
{
  public:
    explicit PrecisionMismatch(std::string const& msg)
        : std::invalid_argument(msg)
    {
    }
};
}
