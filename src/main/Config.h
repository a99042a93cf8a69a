#pragma once
// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>

namespace cpptoml
{
class table;
}

namespace potfuzz
{

class Config
{
    void processConfig(std::shared_ptr<cpptoml::table>);
    void validateConfig();

  public:
    static std::string const STDIN_SPECIAL_NAME;

    Config();

    void load(std::string const& filename);
    void load(std::istream& in);

    // Logging: empty LOG_FILE_PATH logs to the console only.
    std::string LOG_FILE_PATH;
    bool LOG_COLOR;

    // Directory holding snapshot files. When empty, each target's snapshot
    // sits next to it as <target>.json.
    std::string SNAPSHOT_DIR;

    // Precision of an estimator created for a target with no snapshot yet.
    uint32_t DEFAULT_PRECISION;

    // Rounds for `test` when --iterations is not given.
    uint64_t DEFAULT_ITERATIONS;

    // Per-invocation wall-clock limit; 0 means no limit.
    uint32_t INVOCATION_TIMEOUT_MS;

    // Symbol looked up in each target.
    std::string ENTRY_POINT;

    // potfuzz-runner executable used for each invocation. When empty, the
    // one installed beside potfuzz is used, then the one on PATH.
    std::string RUNNER_PATH;

    // Rounds between debug-level progress lines; 0 disables them.
    uint64_t PROGRESS_INTERVAL;
};
}
