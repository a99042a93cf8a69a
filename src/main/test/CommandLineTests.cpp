// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/CommandLine.h"
#include "snapshot/SnapshotStore.h"
#include "test/Catch2.h"
#include "test/TestUtils.h"
#include "test/test.h"
#include "util/Fs.h"
#include "util/TmpDir.h"

#include <fstream>

using namespace potfuzz;

namespace
{
int
runCommandLine(std::vector<std::string> args)
{
    args.insert(args.begin(), "potfuzz");
    std::vector<char*> argv;
    for (auto& a : args)
    {
        argv.push_back(a.data());
    }
    return handleCommandLine(static_cast<int>(argv.size()), argv.data());
}

std::string
writeConfig(std::string const& dir, std::string const& snapshotDir)
{
    auto path = dir + "/potfuzz.cfg";
    std::ofstream out(path);
    out << "SNAPSHOT_DIR = \"" << snapshotDir << "\"\n"
        << "INVOCATION_TIMEOUT_MS = 5000\n"
        << "RUNNER_PATH = \"" << getTestRunnerPath() << "\"\n";
    return path;
}
}

TEST_CASE("command line dispatch", "[commandline]")
{
    REQUIRE(runCommandLine({"version"}) == 0);
    REQUIRE(runCommandLine({"help"}) == 0);
    REQUIRE(runCommandLine({}) == 1);
    REQUIRE(runCommandLine({"no-such-command"}) == 1);
    REQUIRE(runCommandLine({"test"}) == 1);
    REQUIRE(runCommandLine({"test", "--help"}) == 0);
    REQUIRE(runCommandLine({"merge", "only-one-arg"}) == 1);
}

TEST_CASE("command line sessions", "[commandline]")
{
    TmpDir dir(getTestTmpRoot() + "/cli");
    auto snapshots = dir.getName() + "/snapshots";
    auto conf = writeConfig(dir.getName(), snapshots);
    auto target = getTestTargetPath();
    auto snapshot = SnapshotStore::pathForTarget(target, snapshots);

    REQUIRE(runCommandLine({"verify", "--conf", conf, target}) == 1);
    REQUIRE(runCommandLine({"info", "--conf", conf, target}) == 0);

    REQUIRE(runCommandLine({"test", "--conf", conf, target, "--iterations",
                            "25", "--initial-seed", "9"}) == 0);
    auto saved = SnapshotStore(snapshot).load();
    REQUIRE(saved);
    REQUIRE(saved->getHistory().size() == 25);

    REQUIRE(runCommandLine({"verify", "--conf", conf, target}) == 0);
    REQUIRE(runCommandLine({"info", "--conf", conf, target}) == 0);

    {
        testutil::ScopedEnv salt("POTFUZZ_TEST_SALT", "3");
        REQUIRE(runCommandLine({"verify", "--conf", conf, target}) == 1);
    }

    SECTION("merge doubles the history")
    {
        REQUIRE(runCommandLine(
                    {"merge", "--conf", conf, target, snapshot}) == 0);
        REQUIRE(SnapshotStore(snapshot).load()->getHistory().size() == 50);
    }
    SECTION("bad arguments are fatal")
    {
        REQUIRE(runCommandLine({"test", "--conf", conf,
                                dir.getName() + "/absent.so"}) == 1);
        REQUIRE(runCommandLine({"test", "--conf", dir.getName() + "/nope.cfg",
                                target}) == 1);
        REQUIRE(runCommandLine({"merge", "--conf", conf, target,
                                dir.getName() + "/absent.json"}) == 1);
    }
}
