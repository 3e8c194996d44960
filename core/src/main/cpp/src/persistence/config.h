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

namespace pathstore {
namespace persist {

// File layout configuration
namespace file_format {
    constexpr uint32_t kMagic = 0x52545350;          // "PSTR"
    constexpr uint32_t kFooterMagic = 0x46545350;    // "PSTF"
    constexpr uint32_t kVersion = 1;
    constexpr size_t kHeaderSize = 64;               // magic, version, reserved
    // Footer: catalog_offset(8) + catalog_len(8) + crc32c(4) + magic(4)
    constexpr size_t kFooterSize = 24;
}

// Variable table configuration
namespace table {
    // Rows per chunk; one chunk is the unit of file allocation per variable
    constexpr uint32_t kDefaultChunkRows = 64;
    constexpr uint32_t kMaxChunkRows = 1u << 16;
    constexpr size_t kMaxRowBytes = 64 * 1024 * 1024;  // 64MB per row
    constexpr char kNameSeparator = '.';
}

// Object store configuration
namespace store {
    constexpr size_t kDefaultCacheEntries = 100000;
    constexpr const char* kReversedFlag = "is_reversed";
    constexpr const char* kCatalogAttribute = "pathstore.catalog";
    constexpr const char* kNamesSuffix = ".names";
    constexpr const char* kDictValues = "values";
    constexpr const char* kDictPresent = "present";
}

// Environment variable names for runtime overrides
namespace env {
    constexpr const char* kCachePolicy = "PATHSTORE_CACHE_POLICY";
    constexpr const char* kChunkRows = "PATHSTORE_CHUNK_ROWS";
    constexpr const char* kSyncOnFlush = "PATHSTORE_SYNC_ON_FLUSH";
    constexpr const char* kLogDir = "PATHSTORE_LOG_DIR";
}

} // namespace persist
} // namespace pathstore
