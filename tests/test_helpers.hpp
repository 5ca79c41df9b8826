#pragma once
#include <gtest/gtest.h>
#include "elenccxx/ByteSource.h"
#include "elenccxx/Numerology.h"
#include "elenccxx/PathNaming.h"
#include "elenccxx/RecordCodec.h"
#include "elenccxx/Util.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

// ============================================================================
// RECORD BUILDERS
// ============================================================================

inline elenc::record_t makeRecord(uint8_t header, uint8_t footer, uint64_t timestamp,
                                  const std::array<uint8_t, 5>& data = {}) {
    elenc::record_t r{};
    r[0] = header;
    elenc::store_le32(&r[1], static_cast<uint32_t>(timestamp & 0xFFFFFFFFu));
    elenc::store_le32(&r[5], static_cast<uint32_t>(timestamp >> 32));
    std::copy(data.begin(), data.end(), r.begin() + 9);
    r[14] = footer;
    return r;
}

inline elenc::record_t makeEncoderRecord(uint64_t timestamp, uint8_t sec = 0, uint8_t min = 0,
                                         uint8_t hour = 0, uint16_t day = 0) {
    return makeRecord(elenc::encoder_header, elenc::encoder_footer, timestamp,
                      {sec, min, hour, static_cast<uint8_t>(day & 0xFF), static_cast<uint8_t>(day >> 8)});
}

inline elenc::record_t makeIrigRecord(uint64_t timestamp, const std::array<uint8_t, 4>& state) {
    return makeRecord(elenc::irig_header, elenc::irig_footer, timestamp,
                      {state[0], state[1], state[2], state[3], 0x00});
}

inline std::vector<uint8_t> toBytes(const std::vector<elenc::record_t>& records) {
    std::vector<uint8_t> out;
    for (const auto& r : records) out.insert(out.end(), r.begin(), r.end());
    return out;
}

/**
 * @brief N encoder records with timestamps start, start+step, ...
 */
inline std::vector<uint8_t> encoderStream(size_t count, uint64_t start = 1000, uint64_t step = 1) {
    std::vector<elenc::record_t> records;
    for (size_t i = 0; i < count; ++i) records.push_back(makeEncoderRecord(start + i * step));
    return toBytes(records);
}

/**
 * @brief Cut `bytes` into chunks of the given sizes (last chunk takes the rest).
 */
inline std::vector<std::vector<uint8_t>> split(const std::vector<uint8_t>& bytes,
                                               const std::vector<size_t>& sizes) {
    std::vector<std::vector<uint8_t>> chunks;
    size_t pos = 0;
    for (size_t s : sizes) {
        size_t n = std::min(s, bytes.size() - pos);
        chunks.emplace_back(bytes.begin() + pos, bytes.begin() + pos + n);
        pos += n;
    }
    if (pos < bytes.size()) chunks.emplace_back(bytes.begin() + pos, bytes.end());
    return chunks;
}

// ============================================================================
// FILESYSTEM
// ============================================================================

/**
 * @brief Unique scratch directory removed on destruction
 */
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        path_ = fs::temp_directory_path() /
                ("elenc_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

inline std::vector<uint8_t> readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * @brief Path factory producing dir/cap_0000.dat, dir/cap_0001.dat, ...
 */
class CountingPathFactory {
public:
    explicit CountingPathFactory(fs::path dir) : dir_(std::move(dir)) {}

    fs::path operator()() {
        char name[32];
        std::snprintf(name, sizeof(name), "cap_%04u.dat", (*count_)++);
        return dir_ / name;
    }

    unsigned count() const { return *count_; }

private:
    fs::path dir_;
    std::shared_ptr<unsigned> count_ = std::make_shared<unsigned>(0);
};

inline std::vector<fs::path> listFiles(const fs::path& dir) {
    std::vector<fs::path> files;
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file()) files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

// ============================================================================
// BYTE SOURCE
// ============================================================================

/**
 * @brief In-memory ByteSource replaying scripted reads.
 *
 * Each step is either a chunk of bytes or an interruption (std::nullopt).
 * A chunk larger than the requested length is handed out across several
 * reads. Once the script is exhausted every read reports end of stream.
 */
class ScriptedSource : public elenc::ByteSource {
public:
    using step_t = std::optional<std::vector<uint8_t>>;

    explicit ScriptedSource(std::vector<step_t> steps, bool connected = true)
        : steps_(steps.begin(), steps.end()), connected_(connected) {}

    bool connected() const override { return connected_; }

    std::optional<size_t> read(uint8_t* buffer, size_t max_len) override {
        reads_++;
        requested_.push_back(max_len);
        if (interrupt_after_ && reads_ == interrupt_after_ && running_) *running_ = 0;

        if (steps_.empty()) return size_t(0);

        auto& step = steps_.front();
        if (!step) {
            steps_.pop_front();
            return std::nullopt;
        }

        size_t n = std::min(max_len, step->size());
        std::copy(step->begin(), step->begin() + n, buffer);
        step->erase(step->begin(), step->begin() + n);
        if (step->empty()) steps_.pop_front();
        return n;
    }

    /// Clear `running` during the given read (1-based), like a signal would.
    void interruptOnRead(size_t read_number, volatile sig_atomic_t* running) {
        interrupt_after_ = read_number;
        running_ = running;
    }

    size_t reads() const { return reads_; }
    const std::vector<size_t>& requested() const { return requested_; }

private:
    std::deque<step_t> steps_;
    bool connected_;
    size_t reads_ = 0;
    std::vector<size_t> requested_;
    size_t interrupt_after_ = 0;
    volatile sig_atomic_t* running_ = nullptr;
};
