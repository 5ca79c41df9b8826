// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Rotation controller: raw bytes -> rotating capture files, and in parallel
// bytes -> records -> latest encoder timestamp and state.

#pragma once

#include "CarryOverBuffer.h"
#include "FileSession.h"
#include "Numerology.h"
#include "PathNaming.h"
#include "ReaderConfig.h"
#include "RecordCodec.h"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>

namespace elenc
{

/// Snapshot of the most recent encoder record.
struct LatestState
{
    uint64_t timestamp = 0;
    uint32_t state = 0;
};

struct ReaderStats
{
    uint64_t encoder_records = 0;
    uint64_t irig_records = 0;
    uint64_t unknown_records = 0;
    uint64_t files_opened = 0;
    uint64_t bytes_written = 0;
};

class RotationController
{
public:
    RotationController(const ReaderConfig& config, path_factory_t make_path)
    : config_(config)
    , make_path_(std::move(make_path))
    {
        config_.validate();
    }

    explicit RotationController(const ReaderConfig& config)
    : RotationController(config, DatedPathFactory(config.base_dir))
    {}

    ~RotationController() { close(); }

    RotationController(const RotationController&) = delete;
    RotationController& operator=(const RotationController&) = delete;

    /**
     * Accept one chunk from the stream.
     *
     * Idle: open a new file from the path factory, then append.
     * Active: append; once the file is full, close it and go Idle.
     *
     * A chunk that crosses the capacity boundary is split. The bytes that
     * fit complete the current file and the rest start the next one.
     *
     * The chunk is decoded before it is written; latest() covers every byte
     * on disk even if opening the next file throws.
     */
    void feed(const uint8_t* data, size_t len)
    {
        if (len == 0) return;

        decode(data, len);

        size_t offset = 0;
        while (offset < len)
        {
            if (!session_) open_session();

            size_t n = std::min<uint64_t>(len - offset, session_->remaining_bytes());
            session_->append(data + offset, n);
            stats_.bytes_written += n;
            offset += n;

            if (session_->is_exhausted()) close_session();
        }
    }

    void feed(const std::vector<uint8_t>& chunk)
    {
        feed(chunk.data(), chunk.size());
    }

    LatestState latest() const { return latest_; }

    const ReaderStats& stats() const { return stats_; }

    bool active() const { return session_ != nullptr; }

    /// Bytes the current file (or the next one, when Idle) can still take.
    uint64_t bytes_until_rotation() const
    {
        return session_ ? session_->remaining_bytes() : config_.file_records * record_bytes;
    }

    const CarryOverBuffer& carry_over() const { return carry_; }

    /// Close the active file, if any. The next chunk starts a new one.
    void close()
    {
        if (session_) close_session();
    }

private:
    void open_session()
    {
        auto path = make_path_();
        auto session = std::make_unique<FileSession>(config_.file_records);
        session->open(path);
        session_ = std::move(session);
        stats_.files_opened++;

        if (config_.verbose)
            std::cerr << "[Rotation] Opened " << path.string() << std::endl;
    }

    void close_session()
    {
        if (config_.verbose)
        {
            std::cerr << "[Rotation] Closed " << session_->path().string()
                      << " (" << session_->bytes_written() / record_bytes << " records)" << std::endl;
        }
        session_->close();
        session_.reset();
    }

    void decode(const uint8_t* data, size_t len)
    {
        for (const auto& record : carry_.absorb(data, len))
        {
            auto decoded = classify_and_decode(record);
            switch (decoded.kind)
            {
            case RecordKind::ENCODER:
                stats_.encoder_records++;
                latest_.timestamp = decoded.encoder->timestamp;
                latest_.state = decoded.encoder->status;
                break;
            case RecordKind::IRIG:
                stats_.irig_records++;
                break;
            default:
                stats_.unknown_records++;
                if (config_.debug) dump_unknown(record);
                break;
            }
        }
    }

    void dump_unknown(const record_t& record) const
    {
        std::cerr << "[Rotation] Unknown record: " << std::hex << std::setfill('0');
        for (auto b : record) std::cerr << std::setw(2) << int(b) << " ";
        std::cerr << std::dec << std::setfill(' ') << std::endl;
    }

    ReaderConfig config_;
    path_factory_t make_path_;
    std::unique_ptr<FileSession> session_;
    CarryOverBuffer carry_;
    LatestState latest_;
    ReaderStats stats_;
};

} // namespace elenc
