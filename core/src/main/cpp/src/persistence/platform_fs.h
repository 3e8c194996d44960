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
#include <utility>

namespace pathstore {
    namespace persist {

        // Thin POSIX file abstraction used by the file-backed variable table.
        enum class OpenMode {
            ReadOnly,
            ReadWrite,      // Create if missing
            Truncate        // Create, discarding any existing content
        };

        struct FSResult {
            bool ok;
            int err;
        };

        class PlatformFS {
        public:
            static FSResult open_file(const std::string& path, OpenMode mode, intptr_t* out_handle);
            static FSResult close_file(intptr_t file_handle);

            // Positional I/O; short transfers are retried until len bytes move
            static FSResult read_at(intptr_t file_handle, uint64_t offset, void* buf, size_t len);
            static FSResult write_at(intptr_t file_handle, uint64_t offset, const void* buf, size_t len);

            static FSResult flush_file(intptr_t file_handle);
            static FSResult fsync_directory(const std::string& dir_path);
            static FSResult truncate_file(intptr_t file_handle, uint64_t size);

            static std::pair<FSResult, uint64_t> file_size(intptr_t file_handle);
            static FSResult ensure_directory(const std::string& path);
        };

    }
} // namespace pathstore::persist
