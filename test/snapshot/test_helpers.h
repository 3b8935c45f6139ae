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
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include "snapshot/checksums.h"
#include "snapshot/config.h"
#include "snapshot/snapshot_reader.h"
#include "snapshot/snapshot_types.h"
#include "util/endian.hpp"

namespace zksnap::snapshot::test {

/**
 * Builds snapshot images in memory, field by field, in wire order.
 * Nothing is validated so tests can produce any malformed layout.
 */
class SnapshotWriter {
public:
    SnapshotWriter& i32(int32_t v) {
        uint8_t b[4];
        util::store_be_i32(b, v);
        bytes_.insert(bytes_.end(), b, b + 4);
        return *this;
    }

    SnapshotWriter& i64(int64_t v) {
        uint8_t b[8];
        util::store_be_i64(b, v);
        bytes_.insert(bytes_.end(), b, b + 8);
        return *this;
    }

    SnapshotWriter& str(const std::string& s) {
        i32(static_cast<int32_t>(s.size()));
        bytes_.insert(bytes_.end(), s.begin(), s.end());
        return *this;
    }

    SnapshotWriter& buf(const Payload& p) {
        if (!p) {
            return i32(node::kNoPayload);
        }
        i32(static_cast<int32_t>(p->size()));
        bytes_.insert(bytes_.end(), p->begin(), p->end());
        return *this;
    }

    SnapshotWriter& raw(const std::vector<uint8_t>& b) {
        bytes_.insert(bytes_.end(), b.begin(), b.end());
        return *this;
    }

    SnapshotWriter& header(int32_t version = 2, int64_t dbid = 0, int32_t magic = format::kMagic) {
        return i32(magic).i32(version).i64(dbid);
    }

    SnapshotWriter& sessions(const std::vector<std::pair<int64_t, int32_t>>& s) {
        i32(static_cast<int32_t>(s.size()));
        for (const auto& entry : s) {
            i64(entry.first).i32(entry.second);
        }
        return *this;
    }

    SnapshotWriter& acl_cache(const std::vector<std::pair<int64_t, AclList>>& cache) {
        i32(static_cast<int32_t>(cache.size()));
        for (const auto& entry : cache) {
            i64(entry.first);
            i32(static_cast<int32_t>(entry.second.size()));
            for (const Acl& acl : entry.second) {
                i32(acl.perms).str(acl.scheme).str(acl.id);
            }
        }
        return *this;
    }

    SnapshotWriter& stat(const StatPersisted& s) {
        return i64(s.czxid).i64(s.mzxid).i64(s.ctime).i64(s.mtime)
              .i32(s.version).i32(s.cversion).i32(s.aversion)
              .i64(s.ephemeral_owner).i64(s.pzxid);
    }

    SnapshotWriter& node(const std::string& path, const Payload& payload,
                         int64_t acl_ref = node::kOpenAclRef,
                         const StatPersisted& s = StatPersisted()) {
        return str(path).buf(payload).i64(acl_ref).stat(s);
    }

    SnapshotWriter& end_nodes() { return str(format::kEndOfNodes); }

    // Checksum over everything written so far, then the path
    SnapshotWriter& trailer(const std::string& path = "/", int64_t delta = 0) {
        int64_t sum = Adler32::compute(bytes_.data(), bytes_.size());
        return i64(sum + delta).str(path);
    }

    const std::vector<uint8_t>& bytes() const { return bytes_; }
    size_t size() const { return bytes_.size(); }
    std::string data() const { return std::string(bytes_.begin(), bytes_.end()); }

    void write_to(const std::string& path) const {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes_.data()),
                  static_cast<std::streamsize>(bytes_.size()));
    }

private:
    std::vector<uint8_t> bytes_;
};

inline Payload payload(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

inline Acl make_acl(int32_t perms, const std::string& scheme, const std::string& id) {
    Acl a;
    a.perms = perms;
    a.scheme = scheme;
    a.id = id;
    return a;
}

// Header, no sessions, one world ACL under ref 1 and four nodes:
// "" -> "/a" -> "/a/b", "/c"
inline SnapshotWriter scenario_body() {
    SnapshotWriter w;
    w.header(2, 0x1234)
     .sessions({})
     .acl_cache({{1, {make_acl(perms::kAll, "world", "anyone")}}})
     .node("", std::nullopt, node::kOpenAclRef)
     .node("/a", payload("{\"k\":1}"), 1)
     .node("/a/b", payload("child"), 1)
     .node("/c", payload("plain"), node::kOpenAclRef)
     .end_nodes();
    return w;
}

// Decode from memory with the total size known
inline Tree parse_bytes(const SnapshotWriter& w, const DecoderConfig& cfg = DecoderConfig(),
                        ProgressCallback progress = nullptr) {
    std::istringstream in(w.data());
    return SnapshotReader(cfg).read(in, w.size(), std::move(progress));
}

inline std::string create_temp_dir(const std::string& prefix) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(10000, 99999);

    std::filesystem::path dir = std::filesystem::temp_directory_path() /
                                (prefix + "_" + std::to_string(dis(gen)));
    std::filesystem::create_directories(dir);
    return dir.string();
}

// Overwrite len bytes at offset with 0xFF
inline void corrupt_file(const std::string& path, size_t offset, size_t len) {
    std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!file) return;

    file.seekp(static_cast<std::streamoff>(offset));
    std::vector<char> garbage(len, static_cast<char>(0xFF));
    file.write(garbage.data(), static_cast<std::streamsize>(len));
}

inline void truncate_file(const std::string& path, size_t new_size) {
    std::filesystem::resize_file(path, new_size);
}

} // namespace zksnap::snapshot::test
