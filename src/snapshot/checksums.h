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
#include <cstddef>
#include <string>
#include <vector>

namespace zksnap {
namespace snapshot {

// Adler-32 (RFC 1950), the checksum snapshot producers seal the stream with
class Adler32 {
public:
    using value_type = uint32_t;

    Adler32() : a_(1), b_(0) {}

    // Update checksum with more data
    void update(const void* data, size_t len);
    void update(const std::vector<uint8_t>& data) {
        update(data.data(), data.size());
    }
    void update(const std::string& data) {
        update(data.data(), data.size());
    }

    uint32_t value() const { return (b_ << 16) | a_; }

    void reset() { a_ = 1; b_ = 0; }

    // One-shot computation
    static uint32_t compute(const void* data, size_t len);

private:
    uint32_t a_;
    uint32_t b_;

    static constexpr uint32_t kModulus = 65521;
    // Largest n such that 255n(n+1)/2 + (n+1)(kModulus-1) fits in 32 bits
    static constexpr size_t kMaxRun = 5552;
};

} // namespace snapshot
} // namespace zksnap
