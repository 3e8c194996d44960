/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
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
#include <cstring>

namespace pathstore {
namespace persist {

uint32_t CRC32C::table8_[8][256];
std::once_flag CRC32C::init_once_;

void CRC32C::init_tables() {
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t r = i;
        for (int k = 0; k < 8; ++k) {
            r = (r >> 1) ^ (-(int)(r & 1) & kPolynomial);
        }
        table8_[0][i] = r;
    }

    // Tables 1..7 for slicing-by-8
    for (int t = 1; t < 8; ++t) {
        for (uint32_t i = 0; i < 256; ++i) {
            table8_[t][i] = (table8_[t-1][i] >> 8) ^ table8_[0][table8_[t-1][i] & 0xFF];
        }
    }
}

void CRC32C::update(const void* data, size_t len) {
    std::call_once(init_once_, &CRC32C::init_tables);

    if (len == 0 || data == nullptr) return;

    const uint8_t* p = static_cast<const uint8_t*>(data);
    uint32_t crc = value_;

    // Align to 8 bytes
    while (len && (reinterpret_cast<uintptr_t>(p) & 7)) {
        crc = (crc >> 8) ^ table8_[0][(crc ^ *p++) & 0xFF];
        --len;
    }

    while (len >= 8) {
        uint32_t c, d;
        std::memcpy(&c, p, 4);
        std::memcpy(&d, p + 4, 4);
        c ^= crc;
        crc = table8_[7][(c      ) & 0xFF] ^
              table8_[6][(c >>  8) & 0xFF] ^
              table8_[5][(c >> 16) & 0xFF] ^
              table8_[4][(c >> 24) & 0xFF] ^
              table8_[3][(d      ) & 0xFF] ^
              table8_[2][(d >>  8) & 0xFF] ^
              table8_[1][(d >> 16) & 0xFF] ^
              table8_[0][(d >> 24) & 0xFF];
        p += 8;
        len -= 8;
    }

    while (len--) {
        crc = (crc >> 8) ^ table8_[0][(crc ^ *p++) & 0xFF];
    }

    value_ = crc;
}

uint32_t CRC32C::compute(const void* data, size_t len) {
    CRC32C c;
    c.update(data, len);
    return c.finalize();
}

} // namespace persist
} // namespace pathstore
