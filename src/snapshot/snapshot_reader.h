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
#include <istream>
#include <string>
#include "byte_decoder.h"
#include "decoder_config.h"
#include "snapshot_error.h"
#include "snapshot_types.h"
#include "tree_builder.h"

namespace zksnap {
namespace snapshot {

/**
 * SnapshotReader - decodes a snapshot file into a Tree
 *
 * File Layout (big-endian):
 * +---------------------------------------------+
 * | Header   magic:i32 version:i32 dbid:i64     |
 * +---------------------------------------------+
 * | Sessions count:i32, count x (id:i64 to:i32) |
 * +---------------------------------------------+
 * | ACL cache size:i32, size x (ref:i64 len:i32 |
 * |           len x (perms:i32 scheme id))      |
 * +---------------------------------------------+
 * | Nodes    pre-order records until path "/"   |
 * +---------------------------------------------+
 * | Trailer  [checksum:i64 path:string]         |
 * +---------------------------------------------+
 *
 * A load either returns a complete Tree or throws SnapshotError; no
 * partially built tree is ever visible. Each call uses its own decoder,
 * so one reader may serve concurrent loads of different files.
 */
class SnapshotReader {
public:
    explicit SnapshotReader(const DecoderConfig& config = DecoderConfig());

    // Open, decode and close `path`
    Tree read_file(const std::string& path, ProgressCallback progress = nullptr) const;

    // Decode from an already open stream; total_size may be 0 if unknown
    Tree read(std::istream& in, uint64_t total_size = 0,
              ProgressCallback progress = nullptr) const;

    const DecoderConfig& config() const { return config_; }

    // Section readers, in stream order
    static Header read_header(ByteDecoder& d, const DecoderConfig& cfg);
    static int32_t skip_sessions(ByteDecoder& d);
    static AclCache read_acl_cache(ByteDecoder& d, const DecoderConfig& cfg);
    static StatPersisted read_stat(ByteDecoder& d);
    static void read_nodes(ByteDecoder& d, const DecoderConfig& cfg, TreeBuilder& builder);
    static TrailerInfo read_trailer(ByteDecoder& d, const DecoderConfig& cfg);

private:
    Tree decode(ByteDecoder& d) const;

    DecoderConfig config_;
};

// Shorthand for SnapshotReader(cfg).read_file(path, progress)
Tree parse_file(const std::string& path,
                const DecoderConfig& cfg = DecoderConfig(),
                ProgressCallback progress = nullptr);

} // namespace snapshot
} // namespace zksnap
