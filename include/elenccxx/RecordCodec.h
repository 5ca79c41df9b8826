// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Record codec for the elevation encoder stream
//
// Record: [HEADER 1][TS_LSB 4][TS_MSB 4][DATA 5][FOOTER 1]
//   ENC : HEADER=0x99 FOOTER=0x66  DATA=[SEC][MIN][HOUR][DAY 2]
//   IRIG: HEADER=0x55 FOOTER=0xAA  DATA=[STATE 4][0x00]

#pragma once

#include "Numerology.h"
#include "Util.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>

namespace elenc
{

using record_t = std::array<uint8_t, record_bytes>;

enum class RecordKind { UNKNOWN, ENCODER, IRIG };

inline const char* to_string(RecordKind kind)
{
    switch (kind)
    {
    case RecordKind::ENCODER: return "ENC";
    case RecordKind::IRIG: return "IRIG";
    default: return "UNKNOWN";
    }
}

struct EncoderFields
{
    uint64_t timestamp;     // ts_lsb + (ts_msb << 32)
    uint32_t status;        // first four DATA bytes, little-endian
    uint8_t seconds;
    uint8_t minutes;
    uint8_t hours;
    uint16_t day;
};

struct IrigFields
{
    std::array<uint8_t, irig_state_bytes> state;   // undecoded, caller interprets
    uint8_t reserved;
};

struct DecodedRecord
{
    RecordKind kind = RecordKind::UNKNOWN;
    std::optional<EncoderFields> encoder;
    std::optional<IrigFields> irig;
};

inline uint64_t record_timestamp(const record_t& record)
{
    uint64_t lsb = load_le32(&record[record_ts_lsb_offset]);
    uint64_t msb = load_le32(&record[record_ts_msb_offset]);
    return lsb + (msb << 32);
}

inline RecordKind classify(const record_t& record)
{
    uint8_t header = record[record_header_offset];
    uint8_t footer = record[record_footer_offset];

    if (header == encoder_header && footer == encoder_footer) return RecordKind::ENCODER;
    if (header == irig_header && footer == irig_footer) return RecordKind::IRIG;
    return RecordKind::UNKNOWN;
}

/**
 * Classify one aligned record and decode its payload.
 *
 * Unrecognized marker combinations come back as UNKNOWN with no payload.
 * That is a normal outcome; a corrupt frame must never stop the stream.
 */
inline DecodedRecord classify_and_decode(const record_t& record)
{
    DecodedRecord result;
    result.kind = classify(record);

    const uint8_t* data = &record[record_data_offset];

    if (result.kind == RecordKind::ENCODER)
    {
        EncoderFields enc;
        enc.timestamp = record_timestamp(record);
        enc.status = load_le32(data);
        enc.seconds = data[encoder_sec_offset];
        enc.minutes = data[encoder_min_offset];
        enc.hours = data[encoder_hour_offset];
        enc.day = load_le16(data + encoder_day_offset);
        result.encoder = enc;
    }
    else if (result.kind == RecordKind::IRIG)
    {
        IrigFields irig;
        std::copy(data, data + irig_state_bytes, irig.state.begin());
        irig.reserved = data[irig_reserved_offset];
        result.irig = irig;
    }

    return result;
}

} // namespace elenc
