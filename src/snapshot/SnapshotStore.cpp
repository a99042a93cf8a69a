// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "snapshot/SnapshotStore.h"
#include "snapshot/SnapshotError.h"
#include "util/FileSystemException.h"
#include "util/Fs.h"
#include "util/Logging.h"

#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <json/json.h>

namespace potfuzz
{

namespace
{
// Integral doubles such as 3.0 are rejected; a u64 that went through a
// double may have lost precision.
bool
isJsonInteger(Json::Value const& v)
{
    return v.type() == Json::intValue || v.type() == Json::uintValue;
}

Json::Value const&
requireArray(Json::Value const& root, char const* key,
             std::string const& source)
{
    if (!root.isMember(key))
    {
        throw MalformedSnapshot(fmt::format(
            FMT_STRING("missing field '{}' in {}"), key, source));
    }
    auto const& v = root[key];
    if (!v.isArray())
    {
        throw MalformedSnapshot(fmt::format(
            FMT_STRING("field '{}' in {} is not an array"), key, source));
    }
    return v;
}

std::vector<uint64_t>
readU64Array(Json::Value const& root, char const* key,
             std::string const& source)
{
    auto const& arr = requireArray(root, key, source);
    std::vector<uint64_t> res;
    res.reserve(arr.size());
    for (Json::ArrayIndex i = 0; i < arr.size(); ++i)
    {
        auto const& v = arr[i];
        if (!isJsonInteger(v) || !v.isUInt64())
        {
            throw MalformedSnapshot(fmt::format(
                FMT_STRING("{}[{}] in {} is not an unsigned 64-bit integer"),
                key, i, source));
        }
        res.emplace_back(v.asUInt64());
    }
    return res;
}
}

SnapshotStore::SnapshotStore(std::string path) : mPath(std::move(path))
{
}

std::string
SnapshotStore::pathForTarget(std::string const& target,
                             std::string const& snapshotDir)
{
    if (snapshotDir.empty())
    {
        return target + ".json";
    }
    auto base = std::filesystem::path(target).filename().string();
    return (std::filesystem::path(snapshotDir) / (base + ".json")).string();
}

bool
SnapshotStore::exists() const
{
    return fs::exists(mPath);
}

Json::Value
SnapshotStore::toJson(CardinalityEstimator const& estimator)
{
    Json::Value root(Json::objectValue);
    root["precision"] = estimator.getPrecision();

    Json::Value registers(Json::arrayValue);
    for (auto r : estimator.getSketch().getRegisters())
    {
        registers.append(static_cast<Json::UInt>(r));
    }
    root["registers"] = registers;

    Json::Value seeds(Json::arrayValue);
    for (auto s : estimator.getHistory().getSeeds())
    {
        seeds.append(static_cast<Json::UInt64>(s));
    }
    root["seeds"] = seeds;

    Json::Value hashes(Json::arrayValue);
    for (auto h : estimator.getHistory().getHashes())
    {
        hashes.append(static_cast<Json::UInt64>(h));
    }
    root["hashes"] = hashes;
    return root;
}

CardinalityEstimator
SnapshotStore::fromJson(Json::Value const& root, std::string const& source)
{
    if (!root.isObject())
    {
        throw MalformedSnapshot("expected top-level object in " + source);
    }

    if (!root.isMember("precision"))
    {
        throw MalformedSnapshot("missing field 'precision' in " + source);
    }
    auto const& jprec = root["precision"];
    if (!isJsonInteger(jprec) || !jprec.isUInt())
    {
        throw MalformedSnapshot("field 'precision' in " + source +
                                " is not an unsigned integer");
    }
    auto precision = jprec.asUInt();
    if (precision < HyperLogLog::MIN_PRECISION ||
        precision > HyperLogLog::MAX_PRECISION)
    {
        throw MalformedSnapshot(fmt::format(
            FMT_STRING("precision {} in {} outside [{}, {}]"), precision,
            source, HyperLogLog::MIN_PRECISION, HyperLogLog::MAX_PRECISION));
    }

    auto const& jregs = requireArray(root, "registers", source);
    size_t expected = size_t(1) << precision;
    if (jregs.size() != expected)
    {
        throw MalformedSnapshot(
            fmt::format(FMT_STRING("{} holds {} registers, precision {} "
                                   "needs {}"),
                        source, jregs.size(), precision, expected));
    }
    auto maxRank = HyperLogLog::maxRank(precision);
    std::vector<uint8_t> registers;
    registers.reserve(expected);
    for (Json::ArrayIndex i = 0; i < jregs.size(); ++i)
    {
        auto const& v = jregs[i];
        if (!isJsonInteger(v) || !v.isUInt() || v.asUInt() > maxRank)
        {
            throw MalformedSnapshot(fmt::format(
                FMT_STRING("register {} in {} is not an integer in [0, {}]"),
                i, source, maxRank));
        }
        registers.emplace_back(static_cast<uint8_t>(v.asUInt()));
    }

    auto seeds = readU64Array(root, "seeds", source);
    auto hashes = readU64Array(root, "hashes", source);
    if (seeds.size() != hashes.size())
    {
        throw MalformedSnapshot(
            fmt::format(FMT_STRING("{} has {} seeds but {} hashes"), source,
                        seeds.size(), hashes.size()));
    }

    return CardinalityEstimator(
        HyperLogLog(precision, std::move(registers)),
        SeedHistory(std::move(seeds), std::move(hashes)));
}

std::optional<CardinalityEstimator>
SnapshotStore::load() const
{
    if (!exists())
    {
        CLOG_DEBUG(Snapshot, "No snapshot at {}", mPath);
        return std::nullopt;
    }

    std::ifstream in(mPath);
    if (!in)
    {
        throw MalformedSnapshot("error opening " + mPath);
    }
    Json::Value root;
    Json::Reader rdr;
    if (!rdr.parse(in, root))
    {
        throw MalformedSnapshot(fmt::format(
            FMT_STRING("failed to parse JSON in {}: {}"), mPath,
            rdr.getFormattedErrorMessages()));
    }
    auto est = fromJson(root, mPath);
    CLOG_INFO(Snapshot, "Loaded snapshot {} (precision {}, {} entries)",
              mPath, est.getPrecision(), est.getHistory().size());
    return est;
}

void
SnapshotStore::save(CardinalityEstimator const& estimator) const
{
    Json::StyledWriter fw;
    auto text = fw.write(toJson(estimator));

    auto dir = fs::parentDir(mPath);
    if (!fs::exists(dir) && !fs::mkpath(dir))
    {
        FileSystemException::failWith("could not create snapshot directory " +
                                      dir);
    }

    auto tmp = mPath + ".tmp";
    auto fd = fs::openFileToWrite(tmp);
    try
    {
        fs::writeAll(fd, text, tmp);
        fs::flushFileChanges(fd);
    }
    catch (FileSystemException&)
    {
        fs::closeFile(fd, tmp);
        throw;
    }
    fs::closeFile(fd, tmp);

    if (!fs::durableRename(tmp, mPath, dir))
    {
        FileSystemException::failWith("failed to rename " + tmp + " to " +
                                      mPath);
    }
    CLOG_INFO(Snapshot, "Saved snapshot {} (precision {}, {} entries)",
              mPath, estimator.getPrecision(),
              estimator.getHistory().size());
}
}
