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
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace zksnap {
namespace snapshot {

struct Header {
    int32_t magic = 0;
    int32_t version = 0;
    int64_t dbid = 0;
};

// Per-node metadata, in wire order
struct StatPersisted {
    int64_t czxid = 0;           // creating transaction
    int64_t mzxid = 0;           // last modifying transaction
    int64_t ctime = 0;           // ms since epoch
    int64_t mtime = 0;           // ms since epoch
    int32_t version = 0;         // data version
    int32_t cversion = 0;        // child list version
    int32_t aversion = 0;        // ACL version
    int64_t ephemeral_owner = 0; // session id, 0 for persistent nodes
    int64_t pzxid = 0;           // last child list change
};

struct Acl {
    int32_t perms = 0;
    std::string scheme;
    std::string id;
};

using AclList = std::vector<Acl>;
using AclCache = std::unordered_map<int64_t, AclList>;
using Payload = std::optional<std::vector<uint8_t>>;

/**
 * One entry of the namespace. A node owns its children; parent() is a
 * navigation aid only and never owns.
 */
class Node {
public:
    const std::string& id() const { return id_; }
    const std::string& path() const { return path_; }

    // nullopt when the record carried no payload at all
    const Payload& payload() const { return payload_; }
    bool has_payload() const { return payload_.has_value(); }
    size_t payload_size() const { return payload_ ? payload_->size() : 0; }

    int64_t acl_ref() const { return acl_ref_; }
    const StatPersisted& stat() const { return stat_; }

    const Node* parent() const { return parent_; }
    const std::vector<std::unique_ptr<Node>>& children() const { return children_; }

    bool is_root() const { return parent_ == nullptr; }
    bool is_ephemeral() const { return stat_.ephemeral_owner != 0; }

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

private:
    friend class TreeBuilder;

    Node(std::string id, std::string path, Payload payload,
         int64_t acl_ref, const StatPersisted& stat)
        : id_(std::move(id)), path_(std::move(path)), payload_(std::move(payload)),
          acl_ref_(acl_ref), stat_(stat) {}

    std::string id_;
    std::string path_;
    Payload payload_;
    int64_t acl_ref_;
    StatPersisted stat_;
    Node* parent_ = nullptr;
    std::vector<std::unique_ptr<Node>> children_;
};

// Closing checksum/path pair, when the producer wrote one
struct TrailerInfo {
    bool present = false;
    int64_t stored_checksum = 0;
    uint32_t computed_checksum = 0;   // Adler-32 of all bytes before the checksum
    std::string path;

    bool checksum_matches() const {
        return present && stored_checksum == static_cast<int64_t>(computed_checksum);
    }
};

/**
 * Decoded snapshot. Built once by SnapshotReader and read-only after.
 *
 * The lookup holds every node by full path; "" and "/" both resolve
 * to the root object.
 */
class Tree {
public:
    using PathIndex = std::unordered_map<std::string, const Node*>;

    const Header& header() const { return header_; }
    const Node& root() const { return *root_; }
    const PathIndex& nodes_by_path() const { return by_path_; }
    const AclCache& acls() const { return acls_; }
    const TrailerInfo& trailer() const { return trailer_; }
    int32_t session_count() const { return session_count_; }

    // nullptr when the path is unknown
    const Node* find(const std::string& path) const;

    // ACL list for a node; nullptr for the open sentinel or an unknown ref
    const AclList* acl_for(const Node& node) const;

    // Distinct nodes, root included ("/" alias not counted twice)
    size_t node_count() const { return node_count_; }

    Tree(Tree&&) = default;
    Tree& operator=(Tree&&) = default;
    Tree(const Tree&) = delete;
    Tree& operator=(const Tree&) = delete;

private:
    friend class TreeBuilder;
    friend class SnapshotReader;

    Tree() = default;

    Header header_;
    std::unique_ptr<Node> root_;
    PathIndex by_path_;
    AclCache acls_;
    TrailerInfo trailer_;
    int32_t session_count_ = 0;
    size_t node_count_ = 0;
};

} // namespace snapshot
} // namespace zksnap
