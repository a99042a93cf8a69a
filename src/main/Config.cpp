// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Config.h"
#include "estimator/HyperLogLog.h"

#include <stdexcept>

namespace potfuzz
{

std::string const Config::STDIN_SPECIAL_NAME = "stdin";

Config::Config()
{
    LOG_FILE_PATH = "";
    LOG_COLOR = false;
    SNAPSHOT_DIR = "";
    DEFAULT_PRECISION = HyperLogLog::DEFAULT_PRECISION;
    DEFAULT_ITERATIONS = 1000000;
    INVOCATION_TIMEOUT_MS = 0;
    ENTRY_POINT = "test";
    RUNNER_PATH = "";
    PROGRESS_INTERVAL = 100000;
}

void
Config::validateConfig()
{
    HyperLogLog::checkPrecision(DEFAULT_PRECISION);
    if (ENTRY_POINT.empty())
    {
        throw std::invalid_argument("ENTRY_POINT must not be empty");
    }
}
}
