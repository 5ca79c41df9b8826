// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <cstdint>

namespace elenc
{
    // =========================================================================
    // RECORD STRUCTURE
    // =========================================================================
    // [HEADER 1][TS_LSB 4][TS_MSB 4][DATA 5][FOOTER 1]

    const size_t record_bytes = 15;
    const size_t record_header_offset = 0;
    const size_t record_ts_lsb_offset = 1;
    const size_t record_ts_msb_offset = 5;
    const size_t record_data_offset = 9;
    const size_t record_data_bytes = 5;
    const size_t record_footer_offset = 14;

    // --- Markers ---
    const uint8_t encoder_header = 0x99;
    const uint8_t encoder_footer = 0x66;
    const uint8_t irig_header = 0x55;
    const uint8_t irig_footer = 0xAA;

    // --- Encoder DATA field: [SEC][MIN][HOUR][DAY 2] ---
    const size_t encoder_sec_offset = 0;
    const size_t encoder_min_offset = 1;
    const size_t encoder_hour_offset = 2;
    const size_t encoder_day_offset = 3;

    // --- IRIG DATA field: [STATE 4][0x00] ---
    const size_t irig_state_bytes = 4;
    const size_t irig_reserved_offset = 4;

    // =========================================================================
    // FILE STRUCTURE
    // =========================================================================

    const size_t file_header_bytes = 256;
    const size_t file_header_fixed_bytes = 16;      // tag + version + sec + usec
    const uint32_t logger_version = 2021042901;     // bumped when the file layout changes

    // Largest record count whose byte size still fits a signed 64-bit counter.
    const uint64_t max_file_records = INT64_MAX / record_bytes;

    // =========================================================================
    // DEFAULTS
    // =========================================================================

    const char default_peer_address[] = "192.168.10.13";
    const uint16_t default_peer_port = 7;
    const size_t default_chunk_bytes = 128 * record_bytes;
    const uint64_t default_file_records = 1000000;  // records per rotating file
    const char default_base_dir[] = ".";
    const char default_lock_path[] = "./el_enc.lock";
    const unsigned default_settle_ms = 1000;        // wait after connect before reading

    static_assert(record_footer_offset + 1 == record_bytes,
                  "Footer must be the last byte of a record");
    static_assert(record_data_offset + record_data_bytes == record_footer_offset,
                  "DATA field must end right before the footer");
    static_assert(encoder_day_offset + 2 == record_data_bytes,
                  "Encoder day count must fill the DATA field");
    static_assert(default_chunk_bytes % record_bytes == 0,
                  "Default read size should be a whole number of records");
    static_assert(file_header_fixed_bytes < file_header_bytes,
                  "Fixed header fields do not fit in the file header");
}
