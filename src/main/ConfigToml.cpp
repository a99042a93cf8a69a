// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

// Loading of Config from TOML files.

#include "main/Config.h"
#include "estimator/HyperLogLog.h"
#include "util/Fs.h"
#include "util/Logging.h"

#include <cpptoml.h>
#include <fmt/format.h>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <map>

namespace potfuzz
{

namespace
{

using ConfigItem = std::pair<std::string, std::shared_ptr<cpptoml::base>>;

bool
readBool(ConfigItem const& item)
{
    if (!item.second->as<bool>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return item.second->as<bool>()->get();
}

std::string
readString(ConfigItem const& item)
{
    if (!item.second->as<std::string>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return item.second->as<std::string>()->get();
}

template <typename T>
T
castInt(int64_t v, std::string const& name, T min, T max)
{
    if (v < 0 || static_cast<uint64_t>(v) < min ||
        static_cast<uint64_t>(v) > max)
    {
        throw std::invalid_argument(fmt::format(FMT_STRING("bad '{}'"), name));
    }
    return static_cast<T>(v);
}

template <typename T>
T
readInt(ConfigItem const& item, T min = std::numeric_limits<T>::min(),
        T max = std::numeric_limits<T>::max())
{
    if (!item.second->as<int64_t>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return castInt<T>(item.second->as<int64_t>()->get(), item.first, min, max);
}
}

void
Config::load(std::string const& filename)
{
    if (filename != Config::STDIN_SPECIAL_NAME && !fs::exists(filename))
    {
        std::string s;
        s = "No config file ";
        s += filename + " found";
        throw std::invalid_argument(s);
    }

    LOG_DEBUG(DEFAULT_LOG, "Loading config from: {}", filename);
    try
    {
        if (filename == Config::STDIN_SPECIAL_NAME)
        {
            load(std::cin);
        }
        else
        {
            std::ifstream ifs(filename);
            if (!ifs)
            {
                throw std::runtime_error(fmt::format(
                    FMT_STRING("Error opening file '{}'"), filename));
            }
            ifs.exceptions(std::ios::badbit);
            load(ifs);
        }
    }
    catch (std::exception const& ex)
    {
        std::string err("Failed to parse '");
        err += filename;
        err += "' :";
        err += ex.what();
        throw std::invalid_argument(err);
    }
}

void
Config::load(std::istream& in)
{
    std::shared_ptr<cpptoml::table> t;
    cpptoml::parser p(in);
    t = p.parse();
    processConfig(t);
}

void
Config::processConfig(std::shared_ptr<cpptoml::table> t)
{
    try
    {
        if (!t)
        {
            throw std::runtime_error("Could not parse toml");
        }

        for (auto& item : *t)
        {
            LOG_DEBUG(DEFAULT_LOG, "Config item: {}", item.first);

            std::map<std::string, std::function<void()>> confProcessor = {
                {"LOG_FILE_PATH",
                 [&]() { LOG_FILE_PATH = readString(item); }},
                {"LOG_COLOR", [&]() { LOG_COLOR = readBool(item); }},
                {"SNAPSHOT_DIR", [&]() { SNAPSHOT_DIR = readString(item); }},
                {"DEFAULT_PRECISION",
                 [&]() {
                     DEFAULT_PRECISION = readInt<uint32_t>(
                         item, HyperLogLog::MIN_PRECISION,
                         HyperLogLog::MAX_PRECISION);
                 }},
                {"DEFAULT_ITERATIONS",
                 [&]() { DEFAULT_ITERATIONS = readInt<uint64_t>(item); }},
                {"INVOCATION_TIMEOUT_MS",
                 [&]() {
                     INVOCATION_TIMEOUT_MS = readInt<uint32_t>(item);
                 }},
                {"ENTRY_POINT", [&]() { ENTRY_POINT = readString(item); }},
                {"RUNNER_PATH", [&]() { RUNNER_PATH = readString(item); }},
                {"PROGRESS_INTERVAL",
                 [&]() { PROGRESS_INTERVAL = readInt<uint64_t>(item); }}};

            auto it = confProcessor.find(item.first);
            if (it != confProcessor.end())
            {
                it->second();
            }
            else
            {
                std::string err("Unknown configuration entry: '");
                err += item.first;
                err += "'";
                throw std::invalid_argument(err);
            }
        }

        validateConfig();
    }
    catch (cpptoml::parse_exception& ex)
    {
        throw std::invalid_argument(ex.what());
    }
}
}
