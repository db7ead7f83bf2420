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

#include "journal.h"
#include "checksums.h"
#include "config.h"
#include "platform_fs.h"
#include "../util/log.h"
#include "../util/wire.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace dualwrite {
    namespace persist {

        using namespace dualwrite::util;

        namespace {

            struct FrameHeader {
                uint32_t magic;
                uint16_t type;
                uint16_t reserved;
                uint32_t body_len;
                uint32_t body_crc;
                uint32_t header_crc;
            };

            void serialize_header(uint8_t* buf, const FrameHeader& h) {
                store_le32(buf, h.magic);
                store_le16(buf + 4, h.type);
                store_le16(buf + 6, h.reserved);
                store_le32(buf + 8, h.body_len);
                store_le32(buf + 12, h.body_crc);
                store_le32(buf + 16, h.header_crc);
            }

            FrameHeader deserialize_header(const uint8_t* buf) {
                FrameHeader h;
                h.magic = load_le32(buf);
                h.type = load_le16(buf + 4);
                h.reserved = load_le16(buf + 6);
                h.body_len = load_le32(buf + 8);
                h.body_crc = load_le32(buf + 12);
                h.header_crc = load_le32(buf + 16);
                return h;
            }

            std::string describe(const std::string& what, const std::string& path, int err) {
                return what + " " + path + ": " + errnoWithDescription(err);
            }

            // Walks the frames in [data, data+size). Stops at the first frame
            // that is incomplete or fails validation.
            void scan_frames(const uint8_t* data, size_t size,
                             const Journal::ApplyFn& apply,
                             Journal::ReplayStats& stats) {
                size_t off = 0;
                while (off < size) {
                    const size_t left = size - off;
                    if (left < journal::kFrameHeaderSize) {
                        stats.error = "partial frame header";
                        break;
                    }
                    const uint8_t* hdr = data + off;
                    FrameHeader h = deserialize_header(hdr);
                    if (h.magic != journal::kFrameMagic) {
                        stats.error = "bad frame magic";
                        break;
                    }
                    if (crc32c(hdr, journal::kHeaderCrcSpan) != h.header_crc) {
                        stats.error = "header CRC mismatch";
                        break;
                    }
                    if (h.body_len > journal::kMaxBodyBytes) {
                        stats.error = "frame body too large";
                        break;
                    }
                    if (left - journal::kFrameHeaderSize < h.body_len) {
                        stats.error = "partial frame body";
                        break;
                    }
                    const uint8_t* body = hdr + journal::kFrameHeaderSize;
                    if (crc32c(body, h.body_len) != h.body_crc) {
                        stats.error = "body CRC mismatch";
                        break;
                    }
                    if (apply) {
                        apply(h.type, body, h.body_len);
                    }
                    off += journal::kFrameHeaderSize + h.body_len;
                    stats.records++;
                }
                stats.last_good_offset = off;
                stats.dropped_bytes = size - off;
            }

            bool read_file(const std::string& path, uint64_t limit, std::vector<uint8_t>& out) {
                std::ifstream file(path, std::ios::binary);
                if (!file) {
                    return false;
                }
                out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
                if (out.size() > limit) {
                    out.resize(limit);
                }
                return true;
            }

        } // namespace

        std::vector<uint8_t> Journal::encode_frame(uint16_t type, const uint8_t* body, size_t len) {
            if (len > journal::kMaxBodyBytes) {
                throw JournalError("journal record too large: " + std::to_string(len) + " bytes");
            }
            FrameHeader h{};
            h.magic = journal::kFrameMagic;
            h.type = type;
            h.reserved = 0;
            h.body_len = static_cast<uint32_t>(len);
            h.body_crc = crc32c(body, len);

            std::vector<uint8_t> frame(journal::kFrameHeaderSize + len);
            serialize_header(frame.data(), h);
            h.header_crc = crc32c(frame.data(), journal::kHeaderCrcSpan);
            store_le32(frame.data() + 16, h.header_crc);
            if (len > 0) {
                std::memcpy(frame.data() + journal::kFrameHeaderSize, body, len);
            }
            return frame;
        }

        Journal::Journal(const std::string& path, bool sync_each_append)
            : path_(path), sync_each_append_(sync_each_append) {
            std::lock_guard<std::mutex> lk(mu_);
            open_locked();
        }

        Journal::~Journal() {
            std::lock_guard<std::mutex> lk(mu_);
            if (fd_ >= 0) {
                FSResult r = PlatformFS::flush_file(fd_);
                if (!r.ok) {
                    error() << "journal " << path_ << " final sync failed: " << errnoWithDescription(r.err);
                }
                PlatformFS::close_file(fd_);
                fd_ = -1;
            }
        }

        void Journal::open_locked() {
            std::string parent = std::filesystem::path(path_).parent_path().string();
            if (!parent.empty()) {
                FSResult r = PlatformFS::ensure_directory(parent);
                if (!r.ok) {
                    throw JournalError(describe("cannot create journal directory", parent, r.err));
                }
            }

            ReplayStats stats;
            std::vector<uint8_t> data;
            if (read_file(path_, UINT64_MAX, data)) {
                scan_frames(data.data(), data.size(), nullptr, stats);
                if (stats.dropped_bytes > 0) {
                    warning() << "journal " << path_ << ": dropping " << stats.dropped_bytes
                              << " bytes after offset " << stats.last_good_offset
                              << " (" << stats.error << ")";
                    FSResult r = PlatformFS::truncate(path_, stats.last_good_offset);
                    if (!r.ok) {
                        throw JournalError(describe("cannot truncate journal", path_, r.err));
                    }
                }
            }

            FSResult r = PlatformFS::open_append(path_, &fd_);
            if (!r.ok) {
                throw JournalError(describe("cannot open journal", path_, r.err));
            }
            end_offset_ = stats.last_good_offset;
            record_count_ = stats.records;
            open_stats_ = stats;
            debug() << "journal " << path_ << " opened with " << record_count_ << " records";
        }

        void Journal::append(uint16_t type, const std::vector<uint8_t>& body) {
            append(type, body.data(), body.size());
        }

        void Journal::append(uint16_t type, const uint8_t* body, size_t len) {
            std::lock_guard<std::mutex> lk(mu_);
            append_locked(type, body, len);
        }

        void Journal::append_locked(uint16_t type, const uint8_t* body, size_t len) {
            if (fd_ < 0) {
                throw JournalError("journal is closed: " + path_);
            }
            std::vector<uint8_t> frame = encode_frame(type, body, len);
            FSResult r = PlatformFS::write_all(fd_, frame.data(), frame.size(), end_offset_);
            if (!r.ok) {
                throw JournalError(describe("journal write failed", path_, r.err));
            }
            end_offset_ += frame.size();
            record_count_++;
            if (sync_each_append_) {
                r = PlatformFS::flush_file(fd_);
                if (!r.ok) {
                    throw JournalError(describe("journal sync failed", path_, r.err));
                }
            }
        }

        void Journal::sync() {
            std::lock_guard<std::mutex> lk(mu_);
            if (fd_ < 0) return;
            FSResult r = PlatformFS::flush_file(fd_);
            if (!r.ok) {
                throw JournalError(describe("journal sync failed", path_, r.err));
            }
        }

        void Journal::close() {
            std::lock_guard<std::mutex> lk(mu_);
            if (fd_ < 0) return;
            FSResult r = PlatformFS::flush_file(fd_);
            PlatformFS::close_file(fd_);
            fd_ = -1;
            if (!r.ok) {
                throw JournalError(describe("journal sync failed", path_, r.err));
            }
        }

        bool Journal::is_open() const {
            std::lock_guard<std::mutex> lk(mu_);
            return fd_ >= 0;
        }

        uint64_t Journal::end_offset() const {
            std::lock_guard<std::mutex> lk(mu_);
            return end_offset_;
        }

        uint64_t Journal::record_count() const {
            std::lock_guard<std::mutex> lk(mu_);
            return record_count_;
        }

        Journal::ReplayStats Journal::replay(const ApplyFn& apply) const {
            std::lock_guard<std::mutex> lk(mu_);
            ReplayStats stats;
            std::vector<uint8_t> data;
            if (!read_file(path_, end_offset_, data)) {
                throw JournalError("cannot read journal " + path_);
            }
            scan_frames(data.data(), data.size(), apply, stats);
            return stats;
        }

        bool Journal::replay(const std::string& path, const ApplyFn& apply, ReplayStats* stats) {
            ReplayStats local;
            ReplayStats& s = stats ? *stats : local;
            s = ReplayStats{};
            std::vector<uint8_t> data;
            if (!read_file(path, UINT64_MAX, data)) {
                s.error = "cannot open journal file";
                return false;
            }
            scan_frames(data.data(), data.size(), apply, s);
            return true;
        }

        void Journal::compact(const std::vector<JournalRecord>& live) {
            std::lock_guard<std::mutex> lk(mu_);
            const std::string tmp = path_ + journal::kCompactSuffix;

            std::vector<uint8_t> out;
            for (const auto& rec : live) {
                std::vector<uint8_t> frame = encode_frame(rec.type, rec.body.data(), rec.body.size());
                out.insert(out.end(), frame.begin(), frame.end());
            }

            FSResult r = PlatformFS::remove_file(tmp);
            if (!r.ok) {
                throw JournalError(describe("cannot remove stale compaction file", tmp, r.err));
            }
            int tmp_fd = -1;
            r = PlatformFS::open_append(tmp, &tmp_fd);
            if (!r.ok) {
                throw JournalError(describe("cannot create compaction file", tmp, r.err));
            }
            r = PlatformFS::write_all(tmp_fd, out.data(), out.size(), 0);
            if (r.ok) {
                r = PlatformFS::flush_file(tmp_fd);
            }
            PlatformFS::close_file(tmp_fd);
            if (!r.ok) {
                PlatformFS::remove_file(tmp);
                throw JournalError(describe("compaction write failed", tmp, r.err));
            }

            if (fd_ >= 0) {
                PlatformFS::close_file(fd_);
                fd_ = -1;
            }
            r = PlatformFS::atomic_replace(tmp, path_);
            if (!r.ok) {
                // keep appending to the uncompacted file
                FSResult reopen = PlatformFS::open_append(path_, &fd_);
                if (!reopen.ok) fd_ = -1;
                PlatformFS::remove_file(tmp);
                throw JournalError(describe("cannot install compacted journal", path_, r.err));
            }
            r = PlatformFS::open_append(path_, &fd_);
            if (!r.ok) {
                throw JournalError(describe("cannot reopen journal", path_, r.err));
            }
            end_offset_ = out.size();
            record_count_ = live.size();
            info() << "journal " << path_ << " compacted to " << live.size() << " records";
        }

    } // namespace persist
} // namespace dualwrite
