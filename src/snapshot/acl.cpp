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

#include "acl.h"
#include "config.h"

namespace zksnap {
namespace snapshot {

std::string format_permissions(int32_t p) {
    if (p == perms::kAll) {
        return "all";
    }

    static const struct { int32_t bit; const char* name; } kNames[] = {
        { perms::kCreate, "create" },
        { perms::kRead,   "read" },
        { perms::kWrite,  "write" },
        { perms::kDelete, "delete" },
        { perms::kAdmin,  "admin" },
    };

    std::string out;
    for (const auto& n : kNames) {
        if (p & n.bit) {
            if (!out.empty()) out += '|';
            out += n.name;
        }
    }
    return out.empty() ? "none" : out;
}

std::string describe_acl(const Acl& entry) {
    const std::string rendered = format_permissions(entry.perms);
    if (entry.scheme == "digest") {
        // id is "user:base64hash"
        return entry.id.substr(0, entry.id.find(':')) + ": " + rendered;
    }
    return "scheme=" + entry.scheme + " id=" + entry.id + " perms=" + rendered;
}

} // namespace snapshot
} // namespace zksnap
