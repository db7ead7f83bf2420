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

#include <string>
#include <stdexcept>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace dualwrite {
namespace util {

    // Random (version 4) UUID. The generator is not thread-safe, so each
    // thread keeps its own.
    inline boost::uuids::uuid random_uuid() {
        thread_local boost::uuids::random_generator gen;
        return gen();
    }

    inline std::string uuid_string(const boost::uuids::uuid& id) {
        return boost::uuids::to_string(id);
    }

    /**
     * parse the canonical 36 character form
     * throws std::invalid_argument on malformed input
     */
    inline boost::uuids::uuid parse_uuid(const std::string& s) {
        try {
            boost::uuids::string_generator gen;
            return gen(s);
        } catch (const std::runtime_error&) {
            throw std::invalid_argument("malformed uuid: " + s);
        }
    }

} // namespace util
} // namespace dualwrite
