/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The zksnap project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once
#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include "checksums.h"

namespace zksnap {
namespace snapshot {

// (bytes consumed so far, total size or 0 when unknown)
using ProgressCallback = std::function<void(uint64_t, uint64_t)>;

/**
 * ByteDecoder - sequential big-endian reader over a snapshot stream
 *
 * Every read consumes exactly its declared byte count, advances offset()
 * and feeds the running Adler-32. Failures throw SnapshotError tagged
 * with the offset at which the failing field starts:
 * - short reads are ErrorKind::Io
 * - negative or over-ceiling length prefixes are ErrorKind::Format
 *
 * The decoder never seeks; it is single-use and not thread-safe.
 */
class ByteDecoder {
public:
    explicit ByteDecoder(std::istream& in, uint64_t total_size = 0);

    // Progress is reported at most once per `interval` consumed bytes
    void set_progress(ProgressCallback cb, size_t interval);

    int32_t read_int32();
    int64_t read_int64();

    // Length-prefixed byte string; fails on length < 0 or > max_len
    std::string read_string(int32_t max_len);

    // Length-prefixed payload; length -1 yields std::nullopt (no payload),
    // other negatives or length > max_len fail
    std::optional<std::vector<uint8_t>> read_buffer(int32_t max_len);

    // Reads an int64 if a full one is left. Returns false on a clean end
    // of stream; *available receives how many bytes were actually left
    // (0..7) when false is returned.
    bool try_read_int64(int64_t* out, size_t* available = nullptr);

    uint64_t offset() const { return off_; }

    // Adler-32 of every byte consumed so far
    uint32_t checksum() const { return sum_.value(); }

    // Fire the progress callback regardless of the interval
    void flush_progress();

private:
    void read_exact(uint8_t* dst, size_t n, const char* what);
    size_t read_some(uint8_t* dst, size_t n);
    void consumed(const uint8_t* src, size_t n);
    void check_remaining(uint64_t field_offset, int64_t len, const char* what) const;

    std::istream& in_;
    uint64_t off_ = 0;
    uint64_t total_ = 0;
    Adler32 sum_;

    ProgressCallback progress_;
    size_t progress_interval_ = 0;
    uint64_t last_progress_ = 0;
};

} // namespace snapshot
} // namespace zksnap
