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
#include <ostream>
#include <string>
#include "snapshot_types.h"

namespace zksnap {
namespace snapshot {

/**
 * Writes the decoded tree as one JSON document:
 *   { "header": {...}, "acls": [...], "trailer": {...}, "root": node }
 * where each node carries path, id, acl_ref, payload_size (null when
 * absent), stat and a nested "children" array. Payload bytes are not
 * exported.
 */
void write_tree_json(const Tree& tree, std::ostream& out, bool pretty = false);

std::string tree_to_json(const Tree& tree, bool pretty = false);

} // namespace snapshot
} // namespace zksnap
