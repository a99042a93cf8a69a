// Copyright 2015 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/TmpDir.h"
#include "util/Fs.h"
#include "util/Logging.h"
#include "util/Math.h"

#include <fmt/format.h>
#include <stdexcept>

namespace potfuzz
{

TmpDir::TmpDir(std::string const& prefix)
{
    size_t attempts = 0;
    for (;;)
    {
        std::string name = fmt::format(FMT_STRING("{}-{:016x}"), prefix,
                                       gRandomEngine());
        if (!fs::exists(name) && fs::mkpath(name))
        {
            mPath = std::make_unique<std::string>(name);
            break;
        }
        if (++attempts > 100)
        {
            throw std::runtime_error("failed to create TmpDir");
        }
    }
}

TmpDir::TmpDir(TmpDir&& other) : mPath(std::move(other.mPath))
{
}

std::string const&
TmpDir::getName() const
{
    return *mPath;
}

TmpDir::~TmpDir()
{
    if (!mPath)
    {
        return;
    }

    try
    {
        fs::deltree(*mPath);
        CLOG_DEBUG(Fs, "TmpDir deleted: {}", *mPath);
    }
    catch (std::runtime_error& e)
    {
        CLOG_ERROR(Fs, "Failed to delete TmpDir: {}, because: {}", *mPath,
                   e.what());
    }

    mPath.reset();
}

TmpDirManager::TmpDirManager(std::string const& root) : mRoot(root)
{
    clean();
    fs::mkpath(root);
}

TmpDirManager::~TmpDirManager()
{
    clean();
}

void
TmpDirManager::clean()
{
    if (fs::exists(mRoot))
    {
        CLOG_DEBUG(Fs, "TmpDirManager cleaning: {}", mRoot);
        fs::deltree(mRoot);
    }
}

TmpDir
TmpDirManager::tmpDir(std::string const& prefix)
{
    return TmpDir(mRoot + "/" + prefix);
}
}
