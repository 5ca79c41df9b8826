// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "Errors.h"
#include "PathNaming.h"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace elenc
{

/**
 * Single-instance guard. Creates the lock file holding our PID and removes
 * it when the guard goes out of scope.
 *
 * Throws LockError if the file already exists, PathError if its directory
 * is not writable.
 */
class LockFile
{
public:
    explicit LockFile(std::filesystem::path path)
    : path_(std::move(path))
    {
        std::error_code ec;
        if (std::filesystem::exists(path_, ec))
            throw LockError("Locked: " + path_.string());

        auto parent = path_.parent_path();
        if (parent.empty()) parent = ".";
        if (!is_writable(parent))
            throw PathError("No write access to " + parent.string());

        std::ofstream out(path_);
        out << ::getpid() << "\n";
        out.flush();
        if (!out)
        {
            out.close();
            std::filesystem::remove(path_, ec);
            throw PathError("Cannot write lock file " + path_.string());
        }
    }

    ~LockFile()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    LockFile(const LockFile&) = delete;
    LockFile& operator=(const LockFile&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace elenc
