// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Fixed 256-byte preamble written at the start of every capture file.
//
// Bytes 0-3:   "256\n" (length tag)
// Bytes 4-7:   logger version, u32 LE
// Bytes 8-11:  capture start, Unix seconds, u32 LE
// Bytes 12-15: capture start, microseconds, u32 LE
// Bytes 16-:   format description, space padded to 256

#pragma once

#include "Errors.h"
#include "Numerology.h"
#include "Util.h"

#include <array>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <string>

namespace elenc
{

using file_header_t = std::array<uint8_t, file_header_bytes>;

const char file_header_tag[] = "256\n";

const char file_header_text[] =
    "Stimulator encoder data\n"
    "Packet format: [HEADER 1][TS_LSB 4][TS_MSB 4][DATA 5][FOOTER 1]\n"
    "\tENC : HEADER=0x99 FOOTER=0x66\n"
    "\t\tDATA=[SEC][MIN][HOUR][DAY 2]\n"
    "\tIRIG: HEADER=0x55 FOOTER=0xAA\n"
    "\t\tDATA=[STATE 4][0x00]\n";

/**
 * Compose a file header for a capture starting at `start`.
 *
 * Throws HeaderTooLargeError if the fixed fields plus `text` do not fit in
 * file_header_bytes. With the built-in text this is a build-time mismatch.
 */
inline file_header_t make_file_header(std::chrono::system_clock::time_point start,
    const std::string& text = file_header_text)
{
    const size_t used = file_header_fixed_bytes + text.size();
    if (used > file_header_bytes)
    {
        throw HeaderTooLargeError("File header too long: " + std::to_string(used)
            + " > " + std::to_string(file_header_bytes) + " bytes");
    }

    using namespace std::chrono;
    auto since_epoch = duration_cast<microseconds>(start.time_since_epoch());
    auto secs = duration_cast<seconds>(since_epoch);
    auto usecs = since_epoch - duration_cast<microseconds>(secs);

    file_header_t header;
    header.fill(' ');

    std::memcpy(&header[0], file_header_tag, 4);
    store_le32(&header[4], logger_version);
    store_le32(&header[8], static_cast<uint32_t>(secs.count()));
    store_le32(&header[12], static_cast<uint32_t>(usecs.count()));
    std::memcpy(&header[file_header_fixed_bytes], text.data(), text.size());

    return header;
}

struct FileHeaderInfo
{
    std::string tag;
    uint32_t version;
    uint32_t unix_seconds;
    uint32_t microseconds;
    std::string text;       // padding stripped
};

/// Read back a header produced by make_file_header().
inline FileHeaderInfo parse_file_header(const file_header_t& header)
{
    FileHeaderInfo info;
    info.tag.assign(header.begin(), header.begin() + 4);
    info.version = load_le32(&header[4]);
    info.unix_seconds = load_le32(&header[8]);
    info.microseconds = load_le32(&header[12]);
    info.text.assign(header.begin() + file_header_fixed_bytes, header.end());

    auto last = info.text.find_last_not_of(' ');
    info.text.erase(last == std::string::npos ? 0 : last + 1);

    return info;
}

} // namespace elenc
