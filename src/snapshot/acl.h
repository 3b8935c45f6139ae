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

// "all", "none", or the set bits as create|read|write|delete|admin
std::string format_permissions(int32_t perms);

// One-line rendering of an ACL entry; digest entries show only the user
std::string describe_acl(const Acl& entry);

} // namespace snapshot
} // namespace zksnap
