// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace elenc
{

/**
 * Blocking source of stream bytes.
 *
 * read() waits until at least one byte is available and returns the number
 * of bytes stored. A return of 0 means the stream has ended for good.
 * std::nullopt means a signal interrupted the wait before any byte arrived;
 * the caller decides whether to retry.
 */
class ByteSource
{
public:
    virtual ~ByteSource() = default;

    virtual bool connected() const = 0;

    virtual std::optional<size_t> read(uint8_t* buffer, size_t max_len) = 0;
};

} // namespace elenc
