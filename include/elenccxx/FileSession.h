// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "Errors.h"
#include "FileHeader.h"
#include "Numerology.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace elenc
{

/**
 * One capture file: the 256-byte header followed by raw stream bytes.
 *
 * Capacity is configured in records and tracked in bytes. The session is
 * exhausted once capacity_records * record_bytes bytes have been appended.
 * Every append is flushed so the data is visible to readers of the file
 * while the capture is still running.
 */
class FileSession
{
public:
    explicit FileSession(uint64_t capacity_records)
    : capacity_records_(capacity_records)
    {
        if (capacity_records > max_file_records)
        {
            throw Error("Capture file capacity must be at most "
                + std::to_string(max_file_records) + " records.");
        }
        remaining_ = static_cast<int64_t>(capacity_records * record_bytes);
    }

    ~FileSession() { close(); }

    FileSession(const FileSession&) = delete;
    FileSession& operator=(const FileSession&) = delete;

    void open(const std::filesystem::path& path,
        std::chrono::system_clock::time_point start = std::chrono::system_clock::now())
    {
        std::error_code ec;
        if (std::filesystem::exists(path, ec))
            throw PathError("Filename collision: " + path.string() + ".");

        // Compose first so an oversize header leaves nothing behind on disk.
        auto header = make_file_header(start);

        file_.open(path, std::ios::binary | std::ios::trunc);
        if (!file_)
            throw PathError("Cannot open " + path.string() + " for writing.");

        path_ = path;
        file_.write(reinterpret_cast<const char*>(header.data()), header.size());
        file_.flush();
        if (!file_)
            throw WriteError("Failed writing header to " + path_.string());
        header_written_ = true;
    }

    void append(const uint8_t* data, size_t len)
    {
        if (!file_.is_open())
            throw WriteError("Append to a closed capture file.");

        file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
        file_.flush();
        if (!file_)
            throw WriteError("Failed writing to " + path_.string());

        remaining_ -= static_cast<int64_t>(len);
        bytes_written_ += len;
    }

    bool is_exhausted() const { return remaining_ <= 0; }

    /// Bytes that still fit before the session is exhausted.
    uint64_t remaining_bytes() const { return remaining_ > 0 ? static_cast<uint64_t>(remaining_) : 0; }

    void close()
    {
        if (file_.is_open()) file_.close();
    }

    bool is_open() const { return file_.is_open(); }
    bool header_written() const { return header_written_; }
    uint64_t capacity_records() const { return capacity_records_; }
    uint64_t bytes_written() const { return bytes_written_; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::ofstream file_;
    std::filesystem::path path_;
    bool header_written_ = false;
    uint64_t capacity_records_;
    int64_t remaining_ = 0;
    uint64_t bytes_written_ = 0;
};

} // namespace elenc
