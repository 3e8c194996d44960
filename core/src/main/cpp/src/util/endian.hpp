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

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>

namespace pathstore {
namespace util {

/**
 * Little-endian wire helpers for table chunks and the file footer.
 * On little-endian hosts these reduce to plain copies.
 */

inline void store_le32(uint8_t* buf, uint32_t val) {
    buf[0] = static_cast<uint8_t>(val);
    buf[1] = static_cast<uint8_t>(val >> 8);
    buf[2] = static_cast<uint8_t>(val >> 16);
    buf[3] = static_cast<uint8_t>(val >> 24);
}

inline void store_le64(uint8_t* buf, uint64_t val) {
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<uint8_t>(val >> (8 * i));
    }
}

inline uint32_t load_le32(const uint8_t* buf) {
    return static_cast<uint32_t>(buf[0]) |
           (static_cast<uint32_t>(buf[1]) << 8) |
           (static_cast<uint32_t>(buf[2]) << 16) |
           (static_cast<uint32_t>(buf[3]) << 24);
}

inline uint64_t load_le64(const uint8_t* buf) {
    uint64_t val = 0;
    for (int i = 7; i >= 0; --i) {
        val = (val << 8) | buf[i];
    }
    return val;
}

// IEEE 754 single precision, bits treated as uint32

inline void store_lef32(uint8_t* buf, float val) {
    uint32_t bits;
    std::memcpy(&bits, &val, sizeof(float));
    store_le32(buf, bits);
}

inline float load_lef32(const uint8_t* buf) {
    uint32_t bits = load_le32(buf);
    float val;
    std::memcpy(&val, &bits, sizeof(float));
    return val;
}

inline void store_le_i64(uint8_t* buf, int64_t val) {
    store_le64(buf, static_cast<uint64_t>(val));
}

inline int64_t load_le_i64(const uint8_t* buf) {
    return static_cast<int64_t>(load_le64(buf));
}

// Bulk float conversion for fixed-shape array rows

inline void store_lef32_array(uint8_t* buf, const float* vals, size_t n) {
    for (size_t i = 0; i < n; ++i) {
        store_lef32(buf + i * sizeof(float), vals[i]);
    }
}

inline void load_lef32_array(const uint8_t* buf, float* vals, size_t n) {
    for (size_t i = 0; i < n; ++i) {
        vals[i] = load_lef32(buf + i * sizeof(float));
    }
}

} // namespace util
} // namespace pathstore
