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
#include <string>
#include <vector>
#include <mutex>

namespace pathstore {
namespace persist {

// CRC32C (Castagnoli), slicing-by-8 software implementation
class CRC32C {
public:
    using value_type = uint32_t;

    CRC32C() : value_(~0u) {}

    // Update CRC with more data
    void update(const void* data, size_t len);
    void update(const std::vector<uint8_t>& data) {
        update(data.data(), data.size());
    }
    void update(const std::string& data) {
        update(data.data(), data.size());
    }

    // Get final CRC value
    uint32_t finalize() const { return value_ ^ 0xFFFFFFFF; }

    // Reset to initial state
    void reset() { value_ = ~0u; }

    // One-shot computation
    static uint32_t compute(const void* data, size_t len);
    static uint32_t compute(const std::vector<uint8_t>& data) {
        return compute(data.data(), data.size());
    }
    static uint32_t compute(const std::string& data) {
        return compute(data.data(), data.size());
    }

private:
    uint32_t value_;

    // CRC32C polynomial (Castagnoli, reflected)
    static constexpr uint32_t kPolynomial = 0x82F63B78;

    static uint32_t table8_[8][256];
    static std::once_flag init_once_;
    static void init_tables();
};

inline uint32_t crc32c(const void* data, size_t len) {
    return CRC32C::compute(data, len);
}

} // namespace persist
} // namespace pathstore
