// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "Errors.h"
#include "Numerology.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace elenc
{

/// Everything the reader needs, passed in at construction.
struct ReaderConfig
{
    std::string peer_address = default_peer_address;
    uint16_t peer_port = default_peer_port;
    size_t chunk_bytes = default_chunk_bytes;       // upper bound for one read
    uint64_t file_records = default_file_records;   // records per rotating file
    std::filesystem::path base_dir = default_base_dir;
    std::filesystem::path lock_path = default_lock_path;
    unsigned settle_ms = default_settle_ms;
    bool verbose = false;
    bool debug = false;

    void validate() const
    {
        if (chunk_bytes == 0)
            throw Error("Read chunk size must be at least one byte.");
        if (file_records == 0)
            throw Error("File length must be at least one record.");
        if (file_records > max_file_records)
            throw Error("File length must be at most " + std::to_string(max_file_records) + " records.");
    }
};

} // namespace elenc
