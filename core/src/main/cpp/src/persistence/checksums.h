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
#include <vector>
#include <boost/crc.hpp>

namespace dualwrite {
namespace persist {

// CRC32C (Castagnoli), reflected, init and xorout 0xFFFFFFFF.
// crc32c("123456789") == 0xE3069283
class CRC32C {
public:
    using value_type = uint32_t;
    using engine_type = boost::crc_optimal<32, 0x1EDC6F41, 0xFFFFFFFF, 0xFFFFFFFF, true, true>;

    void update(const void* data, size_t len) { engine_.process_bytes(data, len); }
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }

    uint32_t finalize() const { return engine_.checksum(); }
    void reset() { engine_.reset(); }

    static uint32_t compute(const void* data, size_t len) {
        engine_type e;
        e.process_bytes(data, len);
        return e.checksum();
    }
    static uint32_t compute(const std::vector<uint8_t>& data) {
        return compute(data.data(), data.size());
    }

private:
    engine_type engine_;
};

inline uint32_t crc32c(const void* data, size_t len) {
    return CRC32C::compute(data, len);
}

} // namespace persist
} // namespace dualwrite
