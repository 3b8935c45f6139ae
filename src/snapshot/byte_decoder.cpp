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

#include "byte_decoder.h"
#include "config.h"
#include "snapshot_error.h"
#include "../util/endian.hpp"
#include "../util/log.h"

namespace zksnap {
namespace snapshot {

using util::load_be_i32;
using util::load_be_i64;

ByteDecoder::ByteDecoder(std::istream& in, uint64_t total_size)
    : in_(in), total_(total_size) {}

void ByteDecoder::set_progress(ProgressCallback cb, size_t interval) {
    progress_ = std::move(cb);
    progress_interval_ = interval;
    last_progress_ = off_;
}

size_t ByteDecoder::read_some(uint8_t* dst, size_t n) {
    size_t got = 0;
    while (got < n && in_.good()) {
        in_.read(reinterpret_cast<char*>(dst + got), static_cast<std::streamsize>(n - got));
        got += static_cast<size_t>(in_.gcount());
    }
    return got;
}

void ByteDecoder::consumed(const uint8_t* src, size_t n) {
    sum_.update(src, n);
    off_ += n;

    if (progress_ && off_ - last_progress_ >= progress_interval_) {
        flush_progress();
    }
}

void ByteDecoder::flush_progress() {
    if (!progress_) return;
    last_progress_ = off_;
    try {
        progress_(off_, total_);
    } catch (const std::exception& e) {
        // The observer cannot influence the load; stop notifying it
        warning() << "progress observer failed at offset " << off_ << ": " << e.what()
                  << "; progress reporting disabled";
        progress_ = nullptr;
    } catch (...) {
        warning() << "progress observer failed at offset " << off_
                  << " with a non-standard exception; progress reporting disabled";
        progress_ = nullptr;
    }
}

void ByteDecoder::read_exact(uint8_t* dst, size_t n, const char* what) {
    const uint64_t start = off_;
    size_t got = read_some(dst, n);
    if (got < n) {
        if (in_.bad()) {
            throw SnapshotError(ErrorKind::Io, start,
                                std::string("read error while reading ") + what);
        }
        throw SnapshotError(ErrorKind::Io, start,
                            std::string("unexpected end of file reading ") + what +
                            " (wanted " + std::to_string(n) + " bytes, got " +
                            std::to_string(got) + ")");
    }
    consumed(dst, n);
}

void ByteDecoder::check_remaining(uint64_t field_offset, int64_t len, const char* what) const {
    // Only possible when the total size is known up front
    if (total_ == 0 || field_offset > total_) return;
    const uint64_t remaining = total_ - field_offset;
    if (static_cast<uint64_t>(len) > remaining) {
        throw SnapshotError(ErrorKind::Io, field_offset,
                            std::string(what) + " claims " + std::to_string(len) +
                            " bytes but only " + std::to_string(remaining) + " remain");
    }
}

int32_t ByteDecoder::read_int32() {
    uint8_t b[4];
    read_exact(b, sizeof(b), "int32");
    return load_be_i32(b);
}

int64_t ByteDecoder::read_int64() {
    uint8_t b[8];
    read_exact(b, sizeof(b), "int64");
    return load_be_i64(b);
}

std::string ByteDecoder::read_string(int32_t max_len) {
    const uint64_t prefix_off = off_;
    int32_t len = read_int32();
    if (len < 0) {
        throw SnapshotError(ErrorKind::Format, prefix_off,
                            "invalid string length " + std::to_string(len));
    }
    if (len > max_len) {
        throw SnapshotError(ErrorKind::Format, prefix_off,
                            "string length " + std::to_string(len) +
                            " exceeds limit " + std::to_string(max_len));
    }
    check_remaining(off_, len, "string");

    std::string s(static_cast<size_t>(len), '\0');
    if (len > 0) {
        read_exact(reinterpret_cast<uint8_t*>(&s[0]), s.size(), "string bytes");
    }
    return s;
}

std::optional<std::vector<uint8_t>> ByteDecoder::read_buffer(int32_t max_len) {
    const uint64_t prefix_off = off_;
    int32_t len = read_int32();
    if (len == node::kNoPayload) {
        return std::nullopt;
    }
    if (len < 0) {
        throw SnapshotError(ErrorKind::Format, prefix_off,
                            "invalid buffer length " + std::to_string(len));
    }
    if (len > max_len) {
        throw SnapshotError(ErrorKind::Format, prefix_off,
                            "buffer length " + std::to_string(len) +
                            " exceeds limit " + std::to_string(max_len));
    }
    check_remaining(off_, len, "buffer");

    std::vector<uint8_t> buf(static_cast<size_t>(len));
    if (len > 0) {
        read_exact(buf.data(), buf.size(), "buffer bytes");
    }
    return buf;
}

bool ByteDecoder::try_read_int64(int64_t* out, size_t* available) {
    uint8_t b[8];
    size_t got = read_some(b, sizeof(b));
    if (got < sizeof(b)) {
        if (in_.bad()) {
            throw SnapshotError(ErrorKind::Io, off_, "read error while probing for trailer");
        }
        if (available) *available = got;
        // Leftover bytes are counted so offset() still reflects the file
        if (got > 0) consumed(b, got);
        return false;
    }
    consumed(b, sizeof(b));
    *out = load_be_i64(b);
    return true;
}

} // namespace snapshot
} // namespace zksnap
