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

#include "snapshot_stats.h"
#include <utility>
#include <vector>

namespace zksnap {
namespace snapshot {

SnapshotStats collect_stats(const Tree& tree) {
    SnapshotStats stats;

    // Iterative, path depth is unbounded
    std::vector<std::pair<const Node*, size_t>> stack;
    stack.emplace_back(&tree.root(), 0);

    while (!stack.empty()) {
        auto [node, depth] = stack.back();
        stack.pop_back();

        stats.total_nodes++;
        if (node->is_ephemeral()) {
            stats.ephemeral_nodes++;
        }

        const size_t size = node->payload_size();
        stats.total_bytes += size;
        if (size == 0) {
            stats.empty_nodes++;
        }
        if (size > stats.biggest_size) {
            stats.biggest_size = size;
            stats.biggest_path = printable_path(node->path());
        }
        if (depth > stats.max_depth) {
            stats.max_depth = depth;
        }

        // Reverse push keeps pre-order
        const auto& children = node->children();
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.emplace_back(it->get(), depth + 1);
        }
    }
    return stats;
}

} // namespace snapshot
} // namespace zksnap
