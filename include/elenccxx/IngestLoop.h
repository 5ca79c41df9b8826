// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Read loops driving the capture from a ByteSource.

#pragma once

#include "ByteSource.h"
#include "Errors.h"
#include "FileSession.h"
#include "Numerology.h"
#include "RotationController.h"

#include <algorithm>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

namespace elenc
{

enum class StopReason { END_OF_STREAM, INTERRUPTED, COMPLETE };

inline const char* to_string(StopReason reason)
{
    switch (reason)
    {
    case StopReason::END_OF_STREAM: return "end of stream";
    case StopReason::INTERRUPTED: return "interrupted";
    default: return "complete";
    }
}

/// Called after every chunk handed to the controller.
using chunk_callback_t = std::function<void(const RotationController&)>;

/**
 * Rotating capture. Runs until the peer closes the stream or `running` is
 * cleared (by a signal handler). The active file is closed on return.
 *
 * Reads never ask for more than the current file can hold, so chunks line
 * up with file boundaries whenever the peer allows it.
 */
inline StopReason run_rotating(ByteSource& source, RotationController& controller,
    size_t chunk_bytes, const volatile sig_atomic_t& running,
    const chunk_callback_t& on_chunk = {})
{
    if (!source.connected())
        throw NotConnectedError("Not connected.");
    if (chunk_bytes == 0)
        throw Error("Read chunk size must be at least one byte.");

    std::vector<uint8_t> buffer(chunk_bytes);
    StopReason reason = StopReason::INTERRUPTED;

    while (running)
    {
        size_t want = std::min<uint64_t>(chunk_bytes, controller.bytes_until_rotation());
        auto n = source.read(buffer.data(), want);
        if (!n) continue;   // interrupted, re-check running

        if (*n == 0)
        {
            reason = StopReason::END_OF_STREAM;
            break;
        }

        controller.feed(buffer.data(), *n);
        if (on_chunk) on_chunk(controller);
    }

    controller.close();
    return reason;
}

struct BulkResult
{
    StopReason reason;
    uint64_t bytes;     // body bytes written after the header
};

/**
 * Non-rotating capture of exactly `record_count` records into `path`.
 *
 * Writes the file header, then copies raw bytes without decoding until
 * record_count * record_bytes bytes are on disk, the peer closes the
 * stream, or `running` is cleared.
 */
inline BulkResult bulk_capture(ByteSource& source, const std::filesystem::path& path,
    uint64_t record_count, size_t chunk_bytes, const volatile sig_atomic_t& running)
{
    if (!source.connected())
        throw NotConnectedError("Not connected.");
    if (chunk_bytes == 0)
        throw Error("Read chunk size must be at least one byte.");

    FileSession session(record_count);
    session.open(path);

    std::vector<uint8_t> buffer(chunk_bytes);
    BulkResult result{StopReason::COMPLETE, 0};

    while (!session.is_exhausted())
    {
        if (!running)
        {
            result.reason = StopReason::INTERRUPTED;
            break;
        }

        size_t want = std::min<uint64_t>(chunk_bytes, session.remaining_bytes());
        auto n = source.read(buffer.data(), want);
        if (!n) continue;

        if (*n == 0)
        {
            result.reason = StopReason::END_OF_STREAM;
            break;
        }

        session.append(buffer.data(), *n);
    }

    result.bytes = session.bytes_written();
    session.close();
    return result;
}

} // namespace elenc
