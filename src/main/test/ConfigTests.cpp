// Copyright 2016 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Config.h"
#include "test/Catch2.h"
#include "test/test.h"
#include "util/TmpDir.h"

#include <fstream>
#include <sstream>

using namespace potfuzz;

namespace
{
Config
loadFrom(std::string const& text)
{
    std::istringstream in(text);
    Config cfg;
    cfg.load(in);
    return cfg;
}
}

TEST_CASE("config defaults", "[config]")
{
    Config cfg;
    REQUIRE(cfg.LOG_FILE_PATH.empty());
    REQUIRE(!cfg.LOG_COLOR);
    REQUIRE(cfg.SNAPSHOT_DIR.empty());
    REQUIRE(cfg.DEFAULT_PRECISION == 6);
    REQUIRE(cfg.DEFAULT_ITERATIONS == 1000000);
    REQUIRE(cfg.INVOCATION_TIMEOUT_MS == 0);
    REQUIRE(cfg.ENTRY_POINT == "test");
    REQUIRE(cfg.RUNNER_PATH.empty());
    REQUIRE(cfg.PROGRESS_INTERVAL == 100000);
}

TEST_CASE("config loads every key", "[config]")
{
    auto cfg = loadFrom(R"(
LOG_FILE_PATH = "potfuzz.log"
LOG_COLOR = true
SNAPSHOT_DIR = "snapshots"
DEFAULT_PRECISION = 12
DEFAULT_ITERATIONS = 5000
INVOCATION_TIMEOUT_MS = 250
ENTRY_POINT = "fuzz_entry"
RUNNER_PATH = "/opt/potfuzz/bin/potfuzz-runner"
PROGRESS_INTERVAL = 10
)");
    REQUIRE(cfg.LOG_FILE_PATH == "potfuzz.log");
    REQUIRE(cfg.LOG_COLOR);
    REQUIRE(cfg.SNAPSHOT_DIR == "snapshots");
    REQUIRE(cfg.DEFAULT_PRECISION == 12);
    REQUIRE(cfg.DEFAULT_ITERATIONS == 5000);
    REQUIRE(cfg.INVOCATION_TIMEOUT_MS == 250);
    REQUIRE(cfg.ENTRY_POINT == "fuzz_entry");
    REQUIRE(cfg.RUNNER_PATH == "/opt/potfuzz/bin/potfuzz-runner");
    REQUIRE(cfg.PROGRESS_INTERVAL == 10);
}

TEST_CASE("config rejects bad input", "[config]")
{
    REQUIRE_THROWS_AS(loadFrom("NOT_A_KEY = 1"), std::invalid_argument);
    REQUIRE_THROWS_AS(loadFrom("DEFAULT_PRECISION = 3"),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(loadFrom("DEFAULT_PRECISION = 17"),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(loadFrom("DEFAULT_ITERATIONS = -1"),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(loadFrom("LOG_COLOR = \"yes\""), std::invalid_argument);
    REQUIRE_THROWS_AS(loadFrom("ENTRY_POINT = \"\""), std::invalid_argument);
    REQUIRE_THROWS(loadFrom("DEFAULT_PRECISION = "));
}

TEST_CASE("config from file", "[config]")
{
    TmpDir dir(getTestTmpRoot() + "/config");
    auto path = dir.getName() + "/potfuzz.cfg";
    {
        std::ofstream out(path);
        out << "SNAPSHOT_DIR = \"elsewhere\"\n";
    }
    Config cfg;
    cfg.load(path);
    REQUIRE(cfg.SNAPSHOT_DIR == "elsewhere");

    Config missing;
    REQUIRE_THROWS_AS(missing.load(dir.getName() + "/absent.cfg"),
                      std::invalid_argument);
}
