// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/Logging.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fmt/chrono.h>
#include <fstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <stdexcept>
#include <vector>

namespace potfuzz
{

std::array<std::string const, 5> const Logging::kPartitionNames = {
#define LOG_PARTITION(name) #name,
#include "util/LogPartitions.def"
#undef LOG_PARTITION
};

LogLevel Logging::mGlobalLogLevel = LogLevel::LVL_INFO;
std::map<std::string, LogLevel> Logging::mPartitionLogLevels;

bool Logging::mInitialized = false;
bool Logging::mColor = false;
std::string Logging::mLastPattern;
std::string Logging::mLastFilenamePattern;

static bool
iequals(std::string const& a, std::string const& b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

static spdlog::level::level_enum
convert_loglevel(LogLevel level)
{
    auto slev = spdlog::level::info;
    switch (level)
    {
    case LogLevel::LVL_FATAL:
        slev = spdlog::level::critical;
        break;
    case LogLevel::LVL_ERROR:
        slev = spdlog::level::err;
        break;
    case LogLevel::LVL_WARNING:
        slev = spdlog::level::warn;
        break;
    case LogLevel::LVL_INFO:
        slev = spdlog::level::info;
        break;
    case LogLevel::LVL_DEBUG:
        slev = spdlog::level::debug;
        break;
    case LogLevel::LVL_TRACE:
        slev = spdlog::level::trace;
        break;
    default:
        break;
    }
    return slev;
}

void
Logging::init(bool truncate)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    if (!mInitialized)
    {
        using namespace spdlog::sinks;
        using std::make_shared;
        using std::shared_ptr;

        // Console output goes to stderr: stdout belongs to the command
        // results (info, version) and to nothing else.
        auto console = (mColor ? static_cast<shared_ptr<sink>>(
                                     make_shared<stderr_color_sink_mt>())
                               : static_cast<shared_ptr<sink>>(
                                     make_shared<stderr_sink_mt>()));

        std::vector<shared_ptr<sink>> sinks{console};

        if (!mLastFilenamePattern.empty())
        {
            std::time_t time = std::chrono::system_clock::to_time_t(
                std::chrono::system_clock::now());
            auto filename =
                fmt::format(fmt::runtime(mLastFilenamePattern),
                            fmt::arg("datetime", fmt::localtime(time)));

            // Truncate ourselves rather than asking spdlog to: spdlog opens
            // in "wb" mode when truncating, which loses O_APPEND and zero
            // fills the file if an external logrotate shrinks it.
            std::ofstream out;
            if (truncate)
            {
                out.open(filename, std::ios_base::out | std::ios_base::trunc);
            }
            else
            {
                out.open(filename, std::ios_base::out | std::ios_base::app);
            }

            if (out.fail())
            {
                throw std::runtime_error(fmt::format(
                    "Could not open log file {}, check access rights",
                    filename));
            }
            else
            {
                out.close();
            }

            sinks.emplace_back(
                make_shared<basic_file_sink_mt>(filename, /*truncate=*/false));
        }

        auto makeLogger =
            [&](std::string const& name) -> shared_ptr<spdlog::logger> {
            auto logger =
                make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
            spdlog::register_logger(logger);
            return logger;
        };

        spdlog::set_default_logger(makeLogger("default"));
        for (auto const& partition : potfuzz::Logging::kPartitionNames)
        {
            makeLogger(partition);
        }
        if (mLastPattern.empty())
        {
            mLastPattern = "%Y-%m-%dT%H:%M:%S.%e [%^%n %l%$] %v";
        }
        spdlog::set_pattern(mLastPattern);
        spdlog::set_level(convert_loglevel(mGlobalLogLevel));
        for (auto const& pair : mPartitionLogLevels)
        {
            spdlog::get(pair.first)->set_level(convert_loglevel(pair.second));
        }
        spdlog::flush_every(std::chrono::seconds(1));
        spdlog::flush_on(spdlog::level::err);
        mInitialized = true;
    }
}

void
Logging::deinit()
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    if (mInitialized)
    {
#define LOG_PARTITION(name) Logging::name##LogPtr = nullptr;
#include "util/LogPartitions.def"
#undef LOG_PARTITION
        spdlog::drop_all();
        mInitialized = false;
    }
}

void
Logging::setFmt(std::string const& prefix, bool timestamps)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    init();
    mLastPattern = (timestamps ? std::string("%Y-%m-%dT%H:%M:%S.%e ")
                               : std::string()) +
                   prefix + std::string(" [%^%n %l%$] %v");
    spdlog::set_pattern(mLastPattern);
}

void
Logging::setLoggingToFile(std::string const& filename)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    mLastFilenamePattern = filename;
    deinit();
    try
    {
        init();
    }
    catch (std::runtime_error const&)
    {
        // Could not initialize logging to file, fallback on
        // console-only logging and throw
        mLastFilenamePattern.clear();
        deinit();
        init();
        throw;
    }
}

void
Logging::setLoggingColor(bool color)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    mColor = color;
    deinit();
    init();
}

void
Logging::setLogLevel(LogLevel level, const char* partition)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    if (partition)
    {
        mPartitionLogLevels[partition] = level;
    }
    else
    {
        mGlobalLogLevel = level;
        mPartitionLogLevels.clear();
    }
    init();
    auto slev = convert_loglevel(level);
    if (partition)
    {
        spdlog::get(partition)->set_level(slev);
    }
    else
    {
        spdlog::set_level(slev);
    }
}

LogLevel
Logging::getLLfromString(std::string const& levelName)
{
    if (iequals(levelName, "fatal"))
    {
        return LogLevel::LVL_FATAL;
    }

    if (iequals(levelName, "error"))
    {
        return LogLevel::LVL_ERROR;
    }

    if (iequals(levelName, "warning"))
    {
        return LogLevel::LVL_WARNING;
    }

    if (iequals(levelName, "debug"))
    {
        return LogLevel::LVL_DEBUG;
    }

    if (iequals(levelName, "trace"))
    {
        return LogLevel::LVL_TRACE;
    }

    return LogLevel::LVL_INFO;
}

LogLevel
Logging::getLogLevel(std::string const& partition)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    auto p = mPartitionLogLevels.find(partition);
    if (p != mPartitionLogLevels.end())
    {
        return p->second;
    }
    return mGlobalLogLevel;
}

std::string
Logging::getStringFromLL(LogLevel level)
{
    switch (level)
    {
    case LogLevel::LVL_FATAL:
        return "Fatal";
    case LogLevel::LVL_ERROR:
        return "Error";
    case LogLevel::LVL_WARNING:
        return "Warning";
    case LogLevel::LVL_INFO:
        return "Info";
    case LogLevel::LVL_DEBUG:
        return "Debug";
    case LogLevel::LVL_TRACE:
        return "Trace";
    }
    return "????";
}

bool
Logging::logDebug(std::string const& partition)
{
    return getLogLevel(partition) >= LogLevel::LVL_DEBUG;
}

bool
Logging::logTrace(std::string const& partition)
{
    return getLogLevel(partition) >= LogLevel::LVL_TRACE;
}

// throws if partition name is not recognized
std::string
Logging::normalizePartition(std::string const& partition)
{
    for (auto& p : kPartitionNames)
    {
        if (iequals(partition, p))
        {
            return p;
        }
    }
    throw std::invalid_argument("not a valid partition");
}

std::recursive_mutex Logging::mLogMutex;

#define LOG_PARTITION(name) \
    LogPtr Logging::name##LogPtr = nullptr; \
    LogPtr Logging::get##name##LogPtr() \
    { \
        std::lock_guard<std::recursive_mutex> guard(mLogMutex); \
        if (!name##LogPtr) \
        { \
            init(); \
            name##LogPtr = spdlog::get(#name); \
        } \
        return name##LogPtr; \
    }
#include "util/LogPartitions.def"
#undef LOG_PARTITION
}
