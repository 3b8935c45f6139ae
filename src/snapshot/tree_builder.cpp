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

#include "tree_builder.h"
#include "config.h"
#include "snapshot_error.h"
#include "../util/log.h"

namespace zksnap {
namespace snapshot {

std::string TreeBuilder::node_id(const std::string& path) {
    if (path.empty() || path == "/") {
        return node::kRootId;
    }
    size_t idx = path.rfind('/');
    if (idx == std::string::npos) {
        return path;
    }
    return path.substr(idx + 1);
}

std::string TreeBuilder::parent_path(const std::string& path) {
    size_t idx = path.rfind('/');
    if (idx == std::string::npos || idx == 0) {
        return "";
    }
    return path.substr(0, idx);
}

const Node& TreeBuilder::add(std::string path, Payload payload, int64_t acl_ref,
                             const StatPersisted& stat, uint64_t offset) {
    if (index_.count(path)) {
        throw SnapshotError(ErrorKind::Integrity, offset,
                            "duplicate node path \"" + path + "\"");
    }

    Node* parent = nullptr;
    if (!path.empty()) {
        std::string ppath = parent_path(path);
        auto it = index_.find(ppath);
        if (it == index_.end()) {
            throw SnapshotError(ErrorKind::Integrity, offset,
                                "parent \"" + ppath + "\" for path \"" + path + "\" not found");
        }
        parent = it->second;
    }

    std::unique_ptr<Node> node(new Node(node_id(path), path, std::move(payload), acl_ref, stat));
    Node* raw = node.get();

    if (parent) {
        raw->parent_ = parent;
        parent->children_.push_back(std::move(node));
    } else {
        root_ = std::move(node);
    }
    index_.emplace(raw->path_, raw);

    trace() << "node " << (raw->path_.empty() ? "/" : raw->path_)
            << " payload=" << raw->payload_size() << " acl=" << acl_ref;
    return *raw;
}

Tree TreeBuilder::finish(const Header& header, AclCache acls, uint64_t offset) {
    if (!root_) {
        throw SnapshotError(ErrorKind::Integrity, offset, "missing root node");
    }

    Tree tree;
    tree.header_ = header;
    tree.acls_ = std::move(acls);
    tree.node_count_ = index_.size();

    tree.by_path_.reserve(index_.size() + 1);
    for (const auto& entry : index_) {
        tree.by_path_.emplace(entry.first, entry.second);
    }
    // "/" names the root as well as ""
    tree.by_path_[node::kRootId] = root_.get();
    tree.root_ = std::move(root_);

    index_.clear();
    return tree;
}

} // namespace snapshot
} // namespace zksnap
