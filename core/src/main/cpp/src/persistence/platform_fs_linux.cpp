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

#include "platform_fs.h"

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <cerrno>
#include <boost/filesystem.hpp>

namespace pathstore {
    namespace persist {

        static int open_flags(OpenMode m) {
            switch (m) {
                case OpenMode::ReadOnly:  return O_RDONLY;
                case OpenMode::ReadWrite: return O_RDWR | O_CREAT;
                case OpenMode::Truncate:  return O_RDWR | O_CREAT | O_TRUNC;
            }
            return O_RDONLY;
        }

        FSResult PlatformFS::open_file(const std::string& path, OpenMode mode, intptr_t* out_handle) {
            int fd = ::open(path.c_str(), open_flags(mode) | O_CLOEXEC, 0644);
            if (fd < 0) {
                return {false, errno};
            }
            *out_handle = fd;
            return {true, 0};
        }

        FSResult PlatformFS::close_file(intptr_t file_handle) {
            int rc = ::close((int)file_handle);
            return { rc == 0, rc == 0 ? 0 : errno };
        }

        FSResult PlatformFS::read_at(intptr_t fh, uint64_t offset, void* buf, size_t len) {
            uint8_t* p = static_cast<uint8_t*>(buf);
            while (len > 0) {
                ssize_t n = ::pread((int)fh, p, len, (off_t)offset);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return {false, errno};
                }
                if (n == 0) {
                    // Past end of file
                    return {false, EIO};
                }
                p += n;
                offset += (uint64_t)n;
                len -= (size_t)n;
            }
            return {true, 0};
        }

        FSResult PlatformFS::write_at(intptr_t fh, uint64_t offset, const void* buf, size_t len) {
            const uint8_t* p = static_cast<const uint8_t*>(buf);
            while (len > 0) {
                ssize_t n = ::pwrite((int)fh, p, len, (off_t)offset);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return {false, errno};
                }
                p += n;
                offset += (uint64_t)n;
                len -= (size_t)n;
            }
            return {true, 0};
        }

        FSResult PlatformFS::flush_file(intptr_t file_handle) {
            int rc = ::fdatasync((int)file_handle);
            return { rc == 0, rc == 0 ? 0 : errno };
        }

        FSResult PlatformFS::fsync_directory(const std::string& dir_path) {
            int fd = ::open(dir_path.c_str(), O_RDONLY);
            if (fd < 0) {
                return {false, errno};
            }

            int rc = ::fsync(fd);
            int saved_errno = errno;
            ::close(fd);

            return {rc == 0, rc == 0 ? 0 : saved_errno};
        }

        FSResult PlatformFS::truncate_file(intptr_t file_handle, uint64_t size) {
            if (::ftruncate((int)file_handle, (off_t)size) == 0) {
                return {true, 0};
            }
            return {false, errno};
        }

        std::pair<FSResult, uint64_t> PlatformFS::file_size(intptr_t file_handle) {
            struct stat st{};
            int rc = ::fstat((int)file_handle, &st);
            return { { rc == 0, rc == 0 ? 0 : errno }, rc == 0 ? (uint64_t)st.st_size : 0 };
        }

        FSResult PlatformFS::ensure_directory(const std::string& path) {
            boost::system::error_code ec;
            boost::filesystem::create_directories(path, ec);
            if (ec) {
                if (boost::filesystem::is_directory(path)) {
                    return {true, 0};
                }
                return {false, ec.value()};
            }
            return {true, 0};
        }

    } // namespace persist
} // namespace pathstore
