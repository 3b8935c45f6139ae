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
#include <string>
#include "snapshot_types.h"

namespace zksnap {
namespace snapshot {

struct SnapshotStats {
    size_t total_nodes = 0;
    size_t ephemeral_nodes = 0;
    size_t empty_nodes = 0;        // empty or absent payload
    uint64_t total_bytes = 0;
    size_t biggest_size = 0;
    std::string biggest_path = "/";
    size_t max_depth = 0;          // root is depth 0
};

// Walks the whole tree once; ties on biggest_size keep the first in pre-order
SnapshotStats collect_stats(const Tree& tree);

// Printable form of a node path, "/" for the root
inline std::string printable_path(const std::string& path) {
    return path.empty() ? std::string("/") : path;
}

} // namespace snapshot
} // namespace zksnap
