// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "Numerology.h"
#include "RecordCodec.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace elenc
{

/**
 * Re-synchronizes an arbitrarily chunked TCP byte stream into records.
 *
 * Each call to absorb() appends the chunk to the bytes left over from the
 * previous call, emits every complete record from the front, and keeps the
 * trailing partial record for next time.
 *
 * Invariant: remainder().size() < record_bytes after every call, and
 *   before + chunk == record_bytes * emitted + after.
 */
class CarryOverBuffer
{
public:
    std::vector<record_t> absorb(const uint8_t* chunk, size_t len)
    {
        buffer_.insert(buffer_.end(), chunk, chunk + len);

        const size_t count = buffer_.size() / record_bytes;
        std::vector<record_t> records(count);

        for (size_t i = 0; i < count; ++i)
        {
            auto first = buffer_.begin() + i * record_bytes;
            std::copy(first, first + record_bytes, records[i].begin());
        }

        buffer_.erase(buffer_.begin(), buffer_.begin() + count * record_bytes);
        return records;
    }

    std::vector<record_t> absorb(const std::vector<uint8_t>& chunk)
    {
        return absorb(chunk.data(), chunk.size());
    }

    const std::vector<uint8_t>& remainder() const { return buffer_; }

    void clear() { buffer_.clear(); }

private:
    std::vector<uint8_t> buffer_;
};

} // namespace elenc
