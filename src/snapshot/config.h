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
#include <cstddef>

namespace zksnap {
namespace snapshot {

// Wire format constants
namespace format {
    constexpr int32_t kMagic = 0x5A4B534E;          // "ZKSN"
    constexpr int32_t kKnownVersions[] = { 2 };
    constexpr size_t  kHeaderSize = 4 + 4 + 8;      // magic, version, dbid

    // Node stream terminator and trailer path
    constexpr const char* kEndOfNodes = "/";
}

// Decoder limits (defaults for DecoderConfig)
namespace limits {
    constexpr int32_t kMaxStringLen = 16 * 1024 * 1024;     // 16 MiB
    constexpr int32_t kMaxBufferLen = 256 * 1024 * 1024;    // 256 MiB
    constexpr size_t  kProgressInterval = 64 * 1024;        // bytes between progress callbacks
}

// Node identity
namespace node {
    constexpr const char* kRootId = "/";
    constexpr int64_t kOpenAclRef = -1;    // unrestricted, never looked up in the cache
    constexpr int32_t kNoPayload = -1;     // buffer length meaning "absent"
}

// ACL permission bits
namespace perms {
    constexpr int32_t kRead   = 1;
    constexpr int32_t kWrite  = 2;
    constexpr int32_t kCreate = 4;
    constexpr int32_t kDelete = 8;
    constexpr int32_t kAdmin  = 16;
    constexpr int32_t kAll    = kRead | kWrite | kCreate | kDelete | kAdmin;
}

} // namespace snapshot
} // namespace zksnap
