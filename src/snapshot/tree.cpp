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

#include "snapshot_types.h"
#include "config.h"

namespace zksnap {
namespace snapshot {

const Node* Tree::find(const std::string& path) const {
    auto it = by_path_.find(path);
    return it == by_path_.end() ? nullptr : it->second;
}

const AclList* Tree::acl_for(const Node& node) const {
    if (node.acl_ref() == node::kOpenAclRef) {
        return nullptr;
    }
    auto it = acls_.find(node.acl_ref());
    return it == acls_.end() ? nullptr : &it->second;
}

} // namespace snapshot
} // namespace zksnap
