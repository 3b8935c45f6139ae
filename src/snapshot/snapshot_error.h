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
#include <stdexcept>
#include <string>

namespace zksnap {
namespace snapshot {

enum class ErrorKind {
    Io,         // open failure or short read
    Format,     // bad magic, bad length or count, rejected version, checksum
    Integrity   // missing parent, duplicate path, missing root
};

const char* error_kind_name(ErrorKind kind);

/**
 * Terminal failure of a snapshot load. what() already carries the
 * byte offset so callers can print it without knowing the format.
 */
class SnapshotError : public std::runtime_error {
public:
    SnapshotError(ErrorKind kind, uint64_t offset, const std::string& detail);

    ErrorKind kind() const noexcept { return kind_; }
    uint64_t offset() const noexcept { return offset_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    ErrorKind kind_;
    uint64_t offset_;
    std::string detail_;
};

} // namespace snapshot
} // namespace zksnap
