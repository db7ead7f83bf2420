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
#include <cstring>
#include <string>
#include <vector>

namespace dualwrite {
namespace util {

/**
 * Little-endian wire helpers used by every journal record.
 *
 * The encoding is fixed little-endian regardless of host order so journal
 * files move between machines unchanged.
 */

inline void store_le16(uint8_t* buf, uint16_t val) {
    buf[0] = static_cast<uint8_t>(val);
    buf[1] = static_cast<uint8_t>(val >> 8);
}

inline void store_le32(uint8_t* buf, uint32_t val) {
    for (int i = 0; i < 4; ++i) {
        buf[i] = static_cast<uint8_t>(val >> (8 * i));
    }
}

inline void store_le64(uint8_t* buf, uint64_t val) {
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<uint8_t>(val >> (8 * i));
    }
}

inline uint16_t load_le16(const uint8_t* buf) {
    return static_cast<uint16_t>(buf[0]) |
           (static_cast<uint16_t>(buf[1]) << 8);
}

inline uint32_t load_le32(const uint8_t* buf) {
    uint32_t v = 0;
    for (int i = 3; i >= 0; --i) {
        v = (v << 8) | buf[i];
    }
    return v;
}

inline uint64_t load_le64(const uint8_t* buf) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | buf[i];
    }
    return v;
}

// Growable output buffer for building one journal record body.
class ByteWriter {
public:
    void put_u8(uint8_t v) { buf_.push_back(v); }

    void put_u16(uint16_t v) {
        uint8_t b[2];
        store_le16(b, v);
        buf_.insert(buf_.end(), b, b + 2);
    }

    void put_u32(uint32_t v) {
        uint8_t b[4];
        store_le32(b, v);
        buf_.insert(buf_.end(), b, b + 4);
    }

    void put_u64(uint64_t v) {
        uint8_t b[8];
        store_le64(b, v);
        buf_.insert(buf_.end(), b, b + 8);
    }

    void put_i64(int64_t v) { put_u64(static_cast<uint64_t>(v)); }

    void put_f64(double v) {
        uint64_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        put_u64(bits);
    }

    // u32 length prefix followed by raw bytes
    void put_string(const std::string& s) {
        put_u32(static_cast<uint32_t>(s.size()));
        buf_.insert(buf_.end(), s.begin(), s.end());
    }

    void put_bytes(const uint8_t* p, size_t n) { buf_.insert(buf_.end(), p, p + n); }

    const std::vector<uint8_t>& bytes() const { return buf_; }
    std::vector<uint8_t>& bytes() { return buf_; }
    size_t size() const { return buf_.size(); }

private:
    std::vector<uint8_t> buf_;
};

/**
 * Bounds-checked reader over a record body. Every getter returns false once
 * the input is exhausted; callers treat that as a malformed record.
 */
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : p_(data), end_(data + size) {}

    bool get_u8(uint8_t& v) {
        if (remaining() < 1) return false;
        v = *p_++;
        return true;
    }

    bool get_u16(uint16_t& v) {
        if (remaining() < 2) return false;
        v = load_le16(p_);
        p_ += 2;
        return true;
    }

    bool get_u32(uint32_t& v) {
        if (remaining() < 4) return false;
        v = load_le32(p_);
        p_ += 4;
        return true;
    }

    bool get_u64(uint64_t& v) {
        if (remaining() < 8) return false;
        v = load_le64(p_);
        p_ += 8;
        return true;
    }

    bool get_i64(int64_t& v) {
        uint64_t u;
        if (!get_u64(u)) return false;
        v = static_cast<int64_t>(u);
        return true;
    }

    bool get_f64(double& v) {
        uint64_t bits;
        if (!get_u64(bits)) return false;
        std::memcpy(&v, &bits, sizeof(v));
        return true;
    }

    bool get_string(std::string& s) {
        uint32_t n;
        if (!get_u32(n) || remaining() < n) return false;
        s.assign(reinterpret_cast<const char*>(p_), n);
        p_ += n;
        return true;
    }

    bool get_bytes(uint8_t* out, size_t n) {
        if (remaining() < n) return false;
        std::memcpy(out, p_, n);
        p_ += n;
        return true;
    }

    size_t remaining() const { return static_cast<size_t>(end_ - p_); }
    bool at_end() const { return p_ == end_; }

private:
    const uint8_t* p_;
    const uint8_t* end_;
};

} // namespace util
} // namespace dualwrite
