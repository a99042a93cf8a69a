#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "estimator/CardinalityEstimator.h"

#include <optional>
#include <string>

namespace Json
{
class Value;
}

namespace potfuzz
{

// Reads and writes an estimator as a JSON document of the form
//
//   {
//      "precision" : 6,
//      "registers" : [ 0, 3, ... ],   // 2^precision entries
//      "seeds" : [ ... ],
//      "hashes" : [ ... ]             // same length as seeds
//   }
//
// A save replaces the whole file; a crash part-way through leaves the
// previous snapshot in place.
class SnapshotStore
{
    std::string const mPath;

  public:
    explicit SnapshotStore(std::string path);

    // <target>.json, or <snapshotDir>/<basename of target>.json when a
    // snapshot directory is configured.
    static std::string pathForTarget(std::string const& target,
                                     std::string const& snapshotDir);

    std::string const&
    getPath() const
    {
        return mPath;
    }

    bool exists() const;

    // nullopt if there is no snapshot file. Throws MalformedSnapshot if the
    // file cannot be parsed or fails validation.
    std::optional<CardinalityEstimator> load() const;

    // Throws FileSystemException on I/O failure.
    void save(CardinalityEstimator const& estimator) const;

    static Json::Value toJson(CardinalityEstimator const& estimator);

    // `source` names the document in error messages.
    static CardinalityEstimator fromJson(Json::Value const& root,
                                         std::string const& source);
};
}
