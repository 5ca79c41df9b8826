// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <stdexcept>
#include <string>

namespace elenc
{

/// Base of every fatal reader error. Recoverable conditions never throw.
struct Error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Destination missing, not a directory, not writable, or a filename collision.
struct PathError : Error
{
    using Error::Error;
};

/// Composed file header exceeds the fixed header size.
struct HeaderTooLargeError : Error
{
    using Error::Error;
};

/// Capture requested before the byte source was established.
struct NotConnectedError : Error
{
    using Error::Error;
};

/// Another instance holds the lock file.
struct LockError : Error
{
    using Error::Error;
};

/// Capture file could not be written.
struct WriteError : Error
{
    using Error::Error;
};

/// Socket failure other than an interrupted read.
struct StreamError : Error
{
    using Error::Error;
};

} // namespace elenc
