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

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "payload.h"

namespace dualwrite {

    /**
     * What the validator compares for one entity type.
     *
     * parity_fields empty means every field present in either store.
     * renames maps a primary field name to its secondary (legacy) name.
     */
    struct EntitySpec {
        std::string entity_type;
        std::vector<std::string> parity_fields;
        std::map<std::string, std::string> renames;
        std::set<std::string> ignore_fields;
    };

    struct FieldPair {
        std::string primary_field;
        std::string secondary_field;
    };

    class EntityRegistry {
    public:
        // Throws std::invalid_argument on an empty or already registered type
        void register_type(EntitySpec spec);

        bool contains(const std::string& entity_type) const;

        // Throws std::invalid_argument for unregistered types
        EntitySpec get(const std::string& entity_type) const;

        // Registration order
        std::vector<std::string> types() const;

        // Field pairs to compare for one key. Either payload may be null.
        static std::vector<FieldPair> comparison_fields(const EntitySpec& spec,
                                                        const Payload* primary,
                                                        const Payload* secondary);

    private:
        mutable std::mutex mu_;
        std::map<std::string, EntitySpec> specs_;
        std::vector<std::string> order_;
    };

} // namespace dualwrite
