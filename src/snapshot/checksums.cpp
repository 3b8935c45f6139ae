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

#include "checksums.h"

namespace zksnap {
namespace snapshot {

void Adler32::update(const void* data, size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    uint32_t a = a_;
    uint32_t b = b_;

    // Defer the modulo until the sums could overflow
    while (len > 0) {
        size_t run = len < kMaxRun ? len : kMaxRun;
        len -= run;
        while (run--) {
            a += *p++;
            b += a;
        }
        a %= kModulus;
        b %= kModulus;
    }

    a_ = a;
    b_ = b;
}

uint32_t Adler32::compute(const void* data, size_t len) {
    Adler32 sum;
    sum.update(data, len);
    return sum.value();
}

} // namespace snapshot
} // namespace zksnap
