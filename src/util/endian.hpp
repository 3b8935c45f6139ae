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
#include <cstring>

namespace zksnap {
namespace util {

/**
 * Byte order helpers for the snapshot wire format.
 *
 * Snapshots are written by a JVM DataOutputStream, so every multi-byte
 * integer is big-endian (network order) regardless of the producing host.
 * The loads below assemble values byte by byte and are correct on any
 * host byte order and for unaligned buffers.
 */

// Store functions - convert from host to big-endian wire format

inline void store_be32(uint8_t* buf, uint32_t val) {
    buf[0] = static_cast<uint8_t>(val >> 24);
    buf[1] = static_cast<uint8_t>(val >> 16);
    buf[2] = static_cast<uint8_t>(val >> 8);
    buf[3] = static_cast<uint8_t>(val);
}

inline void store_be64(uint8_t* buf, uint64_t val) {
    buf[0] = static_cast<uint8_t>(val >> 56);
    buf[1] = static_cast<uint8_t>(val >> 48);
    buf[2] = static_cast<uint8_t>(val >> 40);
    buf[3] = static_cast<uint8_t>(val >> 32);
    buf[4] = static_cast<uint8_t>(val >> 24);
    buf[5] = static_cast<uint8_t>(val >> 16);
    buf[6] = static_cast<uint8_t>(val >> 8);
    buf[7] = static_cast<uint8_t>(val);
}

// Load functions - convert from big-endian wire format to host

inline uint32_t load_be32(const uint8_t* buf) {
    return (static_cast<uint32_t>(buf[0]) << 24) |
           (static_cast<uint32_t>(buf[1]) << 16) |
           (static_cast<uint32_t>(buf[2]) << 8) |
           static_cast<uint32_t>(buf[3]);
}

inline uint64_t load_be64(const uint8_t* buf) {
    return (static_cast<uint64_t>(buf[0]) << 56) |
           (static_cast<uint64_t>(buf[1]) << 48) |
           (static_cast<uint64_t>(buf[2]) << 40) |
           (static_cast<uint64_t>(buf[3]) << 32) |
           (static_cast<uint64_t>(buf[4]) << 24) |
           (static_cast<uint64_t>(buf[5]) << 16) |
           (static_cast<uint64_t>(buf[6]) << 8) |
           static_cast<uint64_t>(buf[7]);
}

// Signed views; the wire carries two's complement

inline int32_t load_be_i32(const uint8_t* buf) {
    return static_cast<int32_t>(load_be32(buf));
}

inline int64_t load_be_i64(const uint8_t* buf) {
    return static_cast<int64_t>(load_be64(buf));
}

inline void store_be_i32(uint8_t* buf, int32_t val) {
    store_be32(buf, static_cast<uint32_t>(val));
}

inline void store_be_i64(uint8_t* buf, int64_t val) {
    store_be64(buf, static_cast<uint64_t>(val));
}

} // namespace util
} // namespace zksnap
