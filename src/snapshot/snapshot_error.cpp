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

#include "snapshot_error.h"

namespace zksnap {
namespace snapshot {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Io:
        return "io";
    case ErrorKind::Format:
        return "format";
    case ErrorKind::Integrity:
        return "integrity";
    }
    return "unknown";
}

SnapshotError::SnapshotError(ErrorKind kind, uint64_t offset, const std::string& detail)
    : std::runtime_error(std::string(error_kind_name(kind)) + " error at offset " +
                         std::to_string(offset) + ": " + detail),
      kind_(kind), offset_(offset), detail_(detail) {}

} // namespace snapshot
} // namespace zksnap
