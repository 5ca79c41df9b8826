// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "Errors.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace elenc
{

/// Produces the path of the next capture file. Must not return an existing path.
using path_factory_t = std::function<std::filesystem::path()>;

const char capture_filename_format[] = "el_%Y-%m%d-%H%M%S+0000.dat";

inline bool is_writable(const std::filesystem::path& path)
{
    return ::access(path.c_str(), W_OK) == 0;
}

/// Throws PathError unless `path` is an existing, writable directory.
inline void check_directory(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        throw PathError("Path " + path.string() + " does not exist.");
    if (!std::filesystem::is_directory(path, ec))
        throw PathError("Path " + path.string() + " is not a directory.");
    if (!is_writable(path))
        throw PathError("You do not have a write access to the path " + path.string());
}

/**
 * Build <base>/<YYYY>/<MM>/<DD>/el_<YYYY>-<MMDD>-<HHMMSS>+0000.dat for `when`
 * (UTC), creating the date directories.
 *
 * Throws PathError on a filename collision or if the directories cannot be
 * created. Collisions are not retried.
 */
inline std::filesystem::path make_dated_path(const std::filesystem::path& base, std::chrono::system_clock::time_point when)
{
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&t, &utc);

    char year[8], month[4], day[4];
    std::strftime(year, sizeof(year), "%Y", &utc);
    std::strftime(month, sizeof(month), "%m", &utc);
    std::strftime(day, sizeof(day), "%d", &utc);

    std::filesystem::path dir = base / year / month / day;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
        throw PathError("Cannot create directory " + dir.string() + ": " + ec.message());

    char filename[64];
    std::strftime(filename, sizeof(filename), capture_filename_format, &utc);

    std::filesystem::path path = dir / filename;
    if (std::filesystem::exists(path, ec))
        throw PathError("Filename collision: " + path.string() + ".");

    return path;
}

/// Default path factory: dated path under `base` for the current UTC time.
class DatedPathFactory
{
public:
    explicit DatedPathFactory(std::filesystem::path base)
    : base_(std::move(base))
    {}

    std::filesystem::path operator()() const
    {
        return make_dated_path(base_, std::chrono::system_clock::now());
    }

private:
    std::filesystem::path base_;
};

} // namespace elenc
