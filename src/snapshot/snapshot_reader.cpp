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

#include "snapshot_reader.h"
#include "config.h"
#include "../util/log.h"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <boost/filesystem/operations.hpp>

namespace zksnap {
namespace snapshot {

namespace {

bool is_known_version(int32_t version) {
    return std::find(std::begin(format::kKnownVersions), std::end(format::kKnownVersions),
                     version) != std::end(format::kKnownVersions);
}

// Never trust a count for preallocation
constexpr size_t kMaxReserve = 1024;

} // namespace

SnapshotReader::SnapshotReader(const DecoderConfig& config) : config_(config) {
    if (!config_.validate()) {
        throw std::invalid_argument("invalid DecoderConfig: length ceilings and progress "
                                    "interval must be positive");
    }
}

Header SnapshotReader::read_header(ByteDecoder& d, const DecoderConfig& cfg) {
    const uint64_t start = d.offset();

    Header h;
    h.magic = d.read_int32();
    const uint64_t version_off = d.offset();
    h.version = d.read_int32();
    h.dbid = d.read_int64();

    if (h.magic != format::kMagic) {
        std::ostringstream oss;
        oss << "invalid snapshot magic 0x" << std::hex << static_cast<uint32_t>(h.magic)
            << " (expected 0x" << static_cast<uint32_t>(format::kMagic) << ")";
        throw SnapshotError(ErrorKind::Format, start, oss.str());
    }

    if (!is_known_version(h.version)) {
        if (cfg.version_policy == VersionPolicy::RejectUnknown) {
            throw SnapshotError(ErrorKind::Format, version_off,
                                "unsupported snapshot version " + std::to_string(h.version));
        }
        warning() << "snapshot version " << h.version
                  << " is not a known version; decoding with the version 2 layout";
    }

    debug() << "header: version=" << h.version << " dbid=" << h.dbid;
    return h;
}

int32_t SnapshotReader::skip_sessions(ByteDecoder& d) {
    const uint64_t count_off = d.offset();
    int32_t count = d.read_int32();
    if (count < 0) {
        throw SnapshotError(ErrorKind::Format, count_off,
                            "invalid session count " + std::to_string(count));
    }
    for (int32_t i = 0; i < count; i++) {
        d.read_int64();  // session id
        d.read_int32();  // timeout
    }
    debug() << "skipped " << count << " sessions, now at offset " << d.offset();
    return count;
}

AclCache SnapshotReader::read_acl_cache(ByteDecoder& d, const DecoderConfig& cfg) {
    const uint64_t size_off = d.offset();
    int32_t size = d.read_int32();
    if (size < 0) {
        throw SnapshotError(ErrorKind::Format, size_off,
                            "invalid ACL map size " + std::to_string(size));
    }

    AclCache acls;
    acls.reserve(std::min<size_t>(static_cast<size_t>(size), kMaxReserve));

    for (int32_t i = 0; i < size; i++) {
        int64_t ref = d.read_int64();
        const uint64_t len_off = d.offset();
        int32_t len = d.read_int32();
        if (len < 0) {
            throw SnapshotError(ErrorKind::Format, len_off,
                                "invalid ACL vector length " + std::to_string(len) +
                                " for ref " + std::to_string(ref));
        }

        AclList list;
        list.reserve(std::min<size_t>(static_cast<size_t>(len), kMaxReserve));
        for (int32_t j = 0; j < len; j++) {
            Acl acl;
            acl.perms = d.read_int32();
            acl.scheme = d.read_string(cfg.max_string_len);
            acl.id = d.read_string(cfg.max_string_len);
            list.push_back(std::move(acl));
        }

        if (acls.count(ref)) {
            warning() << "ACL ref " << ref << " appears more than once; keeping the last list";
        }
        acls[ref] = std::move(list);
    }

    debug() << "read " << acls.size() << " ACL lists, now at offset " << d.offset();
    return acls;
}

StatPersisted SnapshotReader::read_stat(ByteDecoder& d) {
    StatPersisted s;
    s.czxid = d.read_int64();
    s.mzxid = d.read_int64();
    s.ctime = d.read_int64();
    s.mtime = d.read_int64();
    s.version = d.read_int32();
    s.cversion = d.read_int32();
    s.aversion = d.read_int32();
    s.ephemeral_owner = d.read_int64();
    s.pzxid = d.read_int64();
    return s;
}

void SnapshotReader::read_nodes(ByteDecoder& d, const DecoderConfig& cfg, TreeBuilder& builder) {
    for (;;) {
        const uint64_t record_off = d.offset();
        std::string path = d.read_string(cfg.max_string_len);
        if (path == format::kEndOfNodes) {
            break;
        }

        Payload payload = d.read_buffer(cfg.max_buffer_len);
        int64_t acl_ref = d.read_int64();
        StatPersisted stat = read_stat(d);

        builder.add(std::move(path), std::move(payload), acl_ref, stat, record_off);
    }
    debug() << "read " << builder.size() << " nodes, now at offset " << d.offset();
}

TrailerInfo SnapshotReader::read_trailer(ByteDecoder& d, const DecoderConfig& cfg) {
    TrailerInfo info;
    info.computed_checksum = d.checksum();

    const uint64_t checksum_off = d.offset();
    int64_t stored = 0;
    size_t available = 0;
    if (!d.try_read_int64(&stored, &available)) {
        if (available > 0) {
            warning() << "ignoring " << available << " trailing bytes at offset "
                      << checksum_off << "; too short for a checksum";
        } else {
            debug() << "snapshot has no trailer";
        }
        return info;
    }

    // Once a checksum is present the path must follow
    info.present = true;
    info.stored_checksum = stored;
    info.path = d.read_string(cfg.max_string_len);

    if (info.path != format::kEndOfNodes) {
        warning() << "unexpected trailer path \"" << info.path << "\" at offset "
                  << checksum_off + 8;
    }

    if (!info.checksum_matches()) {
        if (cfg.verify_checksum) {
            std::ostringstream oss;
            oss << "checksum mismatch: stored 0x" << std::hex << stored
                << ", computed 0x" << info.computed_checksum;
            throw SnapshotError(ErrorKind::Format, checksum_off, oss.str());
        }
        warning() << "trailer checksum " << stored << " does not match computed "
                  << info.computed_checksum;
    }
    return info;
}

Tree SnapshotReader::decode(ByteDecoder& d) const {
    Header header = read_header(d, config_);
    int32_t sessions = skip_sessions(d);
    AclCache acls = read_acl_cache(d, config_);

    TreeBuilder builder;
    read_nodes(d, config_, builder);
    Tree tree = builder.finish(header, std::move(acls), d.offset());

    tree.trailer_ = read_trailer(d, config_);
    tree.session_count_ = sessions;
    return tree;
}

Tree SnapshotReader::read(std::istream& in, uint64_t total_size, ProgressCallback progress) const {
    ByteDecoder d(in, total_size);
    if (progress) {
        d.set_progress(std::move(progress), config_.progress_interval);
    }

    Tree tree = decode(d);
    d.flush_progress();
    return tree;
}

Tree SnapshotReader::read_file(const std::string& path, ProgressCallback progress) const {
    auto started = std::chrono::steady_clock::now();

    try {
        boost::system::error_code ec;
        uintmax_t size = boost::filesystem::file_size(path, ec);
        if (ec) {
            throw SnapshotError(ErrorKind::Io, 0, "open snapshot file " + path + ": " + ec.message());
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw SnapshotError(ErrorKind::Io, 0, "open snapshot file " + path + ": " +
                                errnoWithDescription());
        }

        Tree tree = read(file, static_cast<uint64_t>(size), std::move(progress));

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        info() << "loaded snapshot " << path << ": " << tree.node_count() << " nodes, "
               << tree.acls().size() << " ACL lists, " << tree.session_count()
               << " sessions, " << size << " bytes in " << elapsed.count() << " ms";
        return tree;
    } catch (const SnapshotError& e) {
        error() << "failed to load snapshot " << path << ": " << e.what();
        throw;
    }
}

Tree parse_file(const std::string& path, const DecoderConfig& cfg, ProgressCallback progress) {
    return SnapshotReader(cfg).read_file(path, std::move(progress));
}

} // namespace snapshot
} // namespace zksnap
