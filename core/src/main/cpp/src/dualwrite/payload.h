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

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "../util/wire.hpp"

namespace dualwrite {

    /**
     * A single payload field value. Values keep their type tag so that
     * comparison can normalize numbers and strings.
     */
    class Value {
    public:
        // Order matches the variant alternatives below
        enum class Type : uint8_t { Null = 0, Bool = 1, Int = 2, Double = 3, String = 4, List = 5 };
        using List = std::vector<Value>;

        Value() = default;
        Value(std::nullptr_t) {}
        Value(bool b) : v_(b) {}
        Value(int i) : v_(static_cast<int64_t>(i)) {}
        Value(int64_t i) : v_(i) {}
        Value(double d) : v_(d) {}
        Value(const char* s) : v_(std::string(s)) {}
        Value(std::string s) : v_(std::move(s)) {}
        Value(List l) : v_(std::move(l)) {}

        Type type() const { return static_cast<Type>(v_.index()); }
        bool is_null() const { return type() == Type::Null; }
        bool is_numeric() const { return type() == Type::Int || type() == Type::Double; }

        bool as_bool() const { return std::get<bool>(v_); }
        int64_t as_int() const { return std::get<int64_t>(v_); }
        double as_double() const { return std::get<double>(v_); }
        const std::string& as_string() const { return std::get<std::string>(v_); }
        const List& as_list() const { return std::get<List>(v_); }

        // Int or Double widened to double
        double to_double() const;

        // Exact equality including the type tag
        bool operator==(const Value& o) const;
        bool operator!=(const Value& o) const { return !(*this == o); }

        // JSON-like rendering for logs and reports
        std::string to_string() const;

    private:
        std::variant<std::monostate, bool, int64_t, double, std::string, List> v_;
    };

    // Field name to value, ordered by field name.
    using Payload = std::map<std::string, Value>;

    const char* value_type_name(Value::Type t);

    std::string payload_to_string(const Payload& p);

    // Strings trimmed of surrounding whitespace, lists normalized element-wise
    Value normalized(const Value& v);

    /**
     * Equality used when comparing the two stores.
     *  - null equals null
     *  - Int and Double compare numerically within `tolerance` (absolute)
     *  - strings compare after trimming
     *  - lists compare element-wise under the same rules
     */
    bool values_equivalent(const Value& a, const Value& b, double tolerance);

    void encode_value(util::ByteWriter& w, const Value& v);
    bool decode_value(util::ByteReader& r, Value& v);
    void encode_payload(util::ByteWriter& w, const Payload& p);
    bool decode_payload(util::ByteReader& r, Payload& p);

} // namespace dualwrite
