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

namespace dualwrite {
namespace persist {

// Journal framing
namespace journal {
    // "DWJ1" little-endian
    constexpr uint32_t kFrameMagic = 0x314A5744u;
    // magic(4) + type(2) + reserved(2) + body_len(4) + body_crc(4) + header_crc(4)
    constexpr size_t kFrameHeaderSize = 20;
    // CRC covers the first 16 header bytes
    constexpr size_t kHeaderCrcSpan = 16;
    // A body larger than this is treated as corruption rather than allocated
    constexpr uint32_t kMaxBodyBytes = 64u * 1024 * 1024;
    constexpr const char* kCompactSuffix = ".compact";
}

// File names inside DUAL_WRITE_JOURNAL_DIR
namespace files {
    constexpr const char* kRetryQueueJournal = "retry_queue.journal";
    constexpr const char* kLedgerJournal = "write_ledger.journal";
    constexpr const char* kStoreJournal = "store.journal";
}

// When a journal is rewritten with only its live records
namespace compaction {
    constexpr double kGarbageRatio = 2.0;
    constexpr size_t kMinRecords = 1024;

    // At least min_records on disk and more than kGarbageRatio per live record
    inline bool due(uint64_t records, size_t live, size_t min_records = kMinRecords) {
        return records >= min_records &&
               static_cast<double>(records) > kGarbageRatio * static_cast<double>(live);
    }
}

} // namespace persist
} // namespace dualwrite
