// Copyright 2015 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/Fs.h"
#include "util/FileSystemException.h"
#include "util/Logging.h"

#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace potfuzz
{
namespace fs
{

namespace stdfs = std::filesystem;

void
flushFileChanges(native_handle_t fd)
{
    while (fsync(fd) == -1)
    {
        if (errno == EINTR)
        {
            continue;
        }
        FileSystemException::failWithErrno(
            "fs::flushFileChanges() failed on fsync(): ");
    }
}

native_handle_t
openFileToWrite(std::string const& path)
{
    int fd;
    while ((fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC,
                        0644)) == -1)
    {
        if (errno == EINTR)
        {
            continue;
        }
        FileSystemException::failWithErrno(std::string("fs::openFile(\"") +
                                           path + "\") failed: ");
    }
    return fd;
}

void
writeAll(native_handle_t fd, std::string const& data, std::string const& path)
{
    size_t written = 0;
    while (written < data.size())
    {
        auto n = ::write(fd, data.data() + written, data.size() - written);
        if (n == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            FileSystemException::failWithErrno(
                std::string("fs::writeAll(\"") + path + "\") failed: ");
        }
        written += static_cast<size_t>(n);
    }
}

void
closeFile(native_handle_t fd, std::string const& path)
{
    if (::close(fd) == -1 && errno != EINTR)
    {
        FileSystemException::failWithErrno(std::string("fs::closeFile(\"") +
                                           path + "\") failed: ");
    }
}

bool
durableRename(std::string const& src, std::string const& dst,
              std::string const& dir)
{
    std::error_code ec;
    stdfs::rename(src, dst, ec);
    if (ec)
    {
        CLOG_ERROR(Fs, "rename {} -> {} failed: {}", src, dst, ec.message());
        return false;
    }
    int dfd;
    while ((dfd = ::open(dir.c_str(), O_RDONLY)) == -1)
    {
        if (errno == EINTR)
        {
            continue;
        }
        FileSystemException::failWithErrno(
            std::string("Failed to open directory ") + dir + " :");
    }
    while (fsync(dfd) == -1)
    {
        if (errno == EINTR)
        {
            continue;
        }
        FileSystemException::failWithErrno(
            std::string("Failed to fsync directory ") + dir + " :");
    }
    while (::close(dfd) == -1)
    {
        if (errno == EINTR)
        {
            continue;
        }
        FileSystemException::failWithErrno(
            std::string("Failed to close directory ") + dir + " :");
    }
    return true;
}

bool
exists(std::string const& name)
{
    return stdfs::exists(stdfs::path(name));
}

bool
mkdir(std::string const& name)
{
    bool ok = stdfs::create_directory(stdfs::path(name));
    CLOG_DEBUG(Fs, "{}{}", (ok ? "created dir " : "failed to create dir "),
               name);
    return ok;
}

void
deltree(std::string const& d)
{
    stdfs::remove_all(stdfs::path(d));
}

bool
mkpath(const std::string& path)
{
    auto p = stdfs::path(path);
    stdfs::create_directories(p);
    return stdfs::exists(p) && stdfs::is_directory(p);
}

std::string
parentDir(std::string const& path)
{
    auto parent = stdfs::path(path).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
}
}
}
