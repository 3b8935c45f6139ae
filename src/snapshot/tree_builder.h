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
#include <string>
#include <unordered_map>
#include "snapshot_types.h"

namespace zksnap {
namespace snapshot {

/**
 * TreeBuilder - links a pre-order node stream into a Tree
 *
 * Records must arrive parent first. A record whose parent has not been
 * seen, or whose path repeats, is an ErrorKind::Integrity failure; the
 * builder never buffers or reorders.
 */
class TreeBuilder {
public:
    TreeBuilder() = default;

    /**
     * Adds one record. `offset` is where the record starts in the stream
     * and is only used for error reporting.
     */
    const Node& add(std::string path, Payload payload, int64_t acl_ref,
                    const StatPersisted& stat, uint64_t offset);

    /**
     * Completes the tree: requires a root, aliases "/" to it and hands
     * ownership to the returned Tree. The builder is empty afterwards.
     */
    Tree finish(const Header& header, AclCache acls, uint64_t offset);

    size_t size() const { return index_.size(); }
    bool has_root() const { return root_ != nullptr; }

    // Final "/"-delimited segment; "/" for the root path ""
    static std::string node_id(const std::string& path);

    // Everything before the last "/", or "" when that is the leading one
    static std::string parent_path(const std::string& path);

private:
    std::unique_ptr<Node> root_;
    std::unordered_map<std::string, Node*> index_;
};

} // namespace snapshot
} // namespace zksnap
