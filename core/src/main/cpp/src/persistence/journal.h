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
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace dualwrite {
    namespace persist {

        // Thrown when a journal cannot be opened, written or compacted.
        class JournalError : public std::runtime_error {
        public:
            explicit JournalError(const std::string& what) : std::runtime_error(what) {}
        };

        struct JournalRecord {
            uint16_t type = 0;
            std::vector<uint8_t> body;
        };

        // Journal: append-only log of typed, CRC32C-framed records.
        //
        // Frame layout (little-endian):
        //   magic(4) | type(2) | reserved(2) | body_len(4) | body_crc(4) | header_crc(4) | body
        //
        // Opening a journal scans it and truncates anything after the last
        // intact frame, so a write torn by a crash is dropped and later appends
        // continue from a clean boundary. compact() swaps in a rewritten file
        // with rename + directory fsync.
        //
        // All methods are serialized by an internal mutex.
        class Journal {
        public:
            using ApplyFn = std::function<void(uint16_t type, const uint8_t* body, size_t len)>;

            struct ReplayStats {
                uint64_t records = 0;
                uint64_t last_good_offset = 0;
                uint64_t dropped_bytes = 0;   // torn or corrupt tail
                std::string error;            // reason the tail was dropped
            };

            // sync_each_append: fdatasync after every append
            explicit Journal(const std::string& path, bool sync_each_append = true);
            ~Journal();

            Journal(const Journal&) = delete;
            Journal& operator=(const Journal&) = delete;

            void append(uint16_t type, const std::vector<uint8_t>& body);
            void append(uint16_t type, const uint8_t* body, size_t len);
            void sync();
            void close();

            // Applies every intact record in file order.
            ReplayStats replay(const ApplyFn& apply) const;

            // Reads a journal file without opening it for append.
            // Returns false if the file cannot be read.
            static bool replay(const std::string& path, const ApplyFn& apply, ReplayStats* stats);

            // Atomically replaces the journal contents with `live`.
            void compact(const std::vector<JournalRecord>& live);

            uint64_t end_offset() const;
            // Records recovered at open plus records appended since
            uint64_t record_count() const;
            const std::string& path() const noexcept { return path_; }
            bool is_open() const;

            // Dropped tail from the scan at open (0 when the file was clean)
            const ReplayStats& open_stats() const noexcept { return open_stats_; }

            static std::vector<uint8_t> encode_frame(uint16_t type, const uint8_t* body, size_t len);

        private:
            void open_locked();
            void append_locked(uint16_t type, const uint8_t* body, size_t len);

            std::string path_;
            bool sync_each_append_;
            mutable std::mutex mu_;
            int fd_ = -1;
            uint64_t end_offset_ = 0;
            uint64_t record_count_ = 0;
            ReplayStats open_stats_;
        };

    } // namespace persist
} // namespace dualwrite
