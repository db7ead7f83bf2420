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

namespace dualwrite {
    namespace persist {

        struct FSResult {
            bool ok;
            int err;
        };

        // Thin POSIX file layer used by the journal. All calls report errno
        // through FSResult instead of throwing.
        class PlatformFS {
        public:
            // Opens (creating if needed) for appending; *fd is -1 on failure
            static FSResult open_append(const std::string& path, int* fd);
            static FSResult close_file(int fd);

            // Writes every byte at the given offset, retrying short writes and EINTR
            static FSResult write_all(int fd, const void* data, size_t len, uint64_t offset);

            static FSResult flush_file(int fd);
            static FSResult fsync_directory(const std::string& dir_path);

            // rename(tmp, final) followed by an fsync of the parent directory
            static FSResult atomic_replace(const std::string& tmp, const std::string& final);

            static std::pair<FSResult, size_t> file_size(const std::string& path);
            static FSResult ensure_directory(const std::string& path);
            static FSResult truncate(const std::string& path, size_t size);
            static FSResult remove_file(const std::string& path);
        };

    }
} // namespace dualwrite::persist
