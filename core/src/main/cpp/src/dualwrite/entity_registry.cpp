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

#include "entity_registry.h"

#include <stdexcept>

namespace dualwrite {

    void EntityRegistry::register_type(EntitySpec spec) {
        if (spec.entity_type.empty()) {
            throw std::invalid_argument("entity type name is empty");
        }
        std::lock_guard<std::mutex> lk(mu_);
        if (specs_.count(spec.entity_type)) {
            throw std::invalid_argument("entity type already registered: " + spec.entity_type);
        }
        order_.push_back(spec.entity_type);
        std::string name = spec.entity_type;
        specs_.emplace(std::move(name), std::move(spec));
    }

    bool EntityRegistry::contains(const std::string& entity_type) const {
        std::lock_guard<std::mutex> lk(mu_);
        return specs_.count(entity_type) > 0;
    }

    EntitySpec EntityRegistry::get(const std::string& entity_type) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = specs_.find(entity_type);
        if (it == specs_.end()) {
            throw std::invalid_argument("unregistered entity type: " + entity_type);
        }
        return it->second;
    }

    std::vector<std::string> EntityRegistry::types() const {
        std::lock_guard<std::mutex> lk(mu_);
        return order_;
    }

    std::vector<FieldPair> EntityRegistry::comparison_fields(const EntitySpec& spec,
                                                             const Payload* primary,
                                                             const Payload* secondary) {
        auto secondary_name = [&spec](const std::string& f) {
            auto it = spec.renames.find(f);
            return it == spec.renames.end() ? f : it->second;
        };

        std::vector<FieldPair> out;
        if (!spec.parity_fields.empty()) {
            for (const auto& f : spec.parity_fields) {
                if (spec.ignore_fields.count(f)) continue;
                out.push_back(FieldPair{f, secondary_name(f)});
            }
            return out;
        }

        std::map<std::string, std::string> reverse;
        for (const auto& kv : spec.renames) {
            reverse[kv.second] = kv.first;
        }

        std::set<std::string> fields;
        if (primary) {
            for (const auto& kv : *primary) fields.insert(kv.first);
        }
        if (secondary) {
            for (const auto& kv : *secondary) {
                auto it = reverse.find(kv.first);
                fields.insert(it == reverse.end() ? kv.first : it->second);
            }
        }
        for (const auto& f : fields) {
            if (spec.ignore_fields.count(f)) continue;
            out.push_back(FieldPair{f, secondary_name(f)});
        }
        return out;
    }

} // namespace dualwrite
