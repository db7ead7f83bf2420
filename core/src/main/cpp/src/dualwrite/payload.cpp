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

#include "payload.h"

#include <cmath>
#include <sstream>

namespace dualwrite {

    namespace {

        std::string trim(const std::string& s) {
            const char* ws = " \t\r\n\f\v";
            size_t b = s.find_first_not_of(ws);
            if (b == std::string::npos) return std::string();
            size_t e = s.find_last_not_of(ws);
            return s.substr(b, e - b + 1);
        }

        void quote(std::ostringstream& os, const std::string& s) {
            os << '"';
            for (char c : s) {
                if (c == '"' || c == '\\') os << '\\';
                os << c;
            }
            os << '"';
        }

        // Absorbs binary rounding noise such as 0.1 + 0.2
        constexpr double kEpsilon = 1e-9;

        // Bound on nesting when decoding lists from a journal
        constexpr int kMaxDepth = 32;

        bool decode_value_depth(util::ByteReader& r, Value& v, int depth);

    }

    double Value::to_double() const {
        if (type() == Type::Int) return static_cast<double>(as_int());
        return as_double();
    }

    bool Value::operator==(const Value& o) const {
        return v_ == o.v_;
    }

    std::string Value::to_string() const {
        std::ostringstream os;
        switch (type()) {
        case Type::Null:
            os << "null";
            break;
        case Type::Bool:
            os << (as_bool() ? "true" : "false");
            break;
        case Type::Int:
            os << as_int();
            break;
        case Type::Double:
            os << as_double();
            break;
        case Type::String:
            quote(os, as_string());
            break;
        case Type::List: {
            os << '[';
            bool first = true;
            for (const auto& e : as_list()) {
                if (!first) os << ", ";
                first = false;
                os << e.to_string();
            }
            os << ']';
            break;
        }
        }
        return os.str();
    }

    const char* value_type_name(Value::Type t) {
        switch (t) {
        case Value::Type::Null:   return "null";
        case Value::Type::Bool:   return "bool";
        case Value::Type::Int:    return "int";
        case Value::Type::Double: return "double";
        case Value::Type::String: return "string";
        case Value::Type::List:   return "list";
        }
        return "unknown";
    }

    std::string payload_to_string(const Payload& p) {
        std::ostringstream os;
        os << '{';
        bool first = true;
        for (const auto& kv : p) {
            if (!first) os << ", ";
            first = false;
            quote(os, kv.first);
            os << ": " << kv.second.to_string();
        }
        os << '}';
        return os.str();
    }

    Value normalized(const Value& v) {
        switch (v.type()) {
        case Value::Type::String:
            return Value(trim(v.as_string()));
        case Value::Type::List: {
            Value::List out;
            out.reserve(v.as_list().size());
            for (const auto& e : v.as_list()) {
                out.push_back(normalized(e));
            }
            return Value(std::move(out));
        }
        default:
            return v;
        }
    }

    bool values_equivalent(const Value& a, const Value& b, double tolerance) {
        if (a.is_numeric() && b.is_numeric()) {
            if (a.type() == Value::Type::Int && b.type() == Value::Type::Int) {
                int64_t x = a.as_int();
                int64_t y = b.as_int();
                if (x == y) return true;
                uint64_t diff = x > y ? static_cast<uint64_t>(x) - static_cast<uint64_t>(y)
                                      : static_cast<uint64_t>(y) - static_cast<uint64_t>(x);
                return static_cast<double>(diff) <= tolerance;
            }
            return std::fabs(a.to_double() - b.to_double()) <= tolerance + kEpsilon;
        }
        if (a.type() != b.type()) {
            return false;
        }
        switch (a.type()) {
        case Value::Type::Null:
            return true;
        case Value::Type::Bool:
            return a.as_bool() == b.as_bool();
        case Value::Type::String:
            return trim(a.as_string()) == trim(b.as_string());
        case Value::Type::List: {
            const auto& la = a.as_list();
            const auto& lb = b.as_list();
            if (la.size() != lb.size()) return false;
            for (size_t i = 0; i < la.size(); ++i) {
                if (!values_equivalent(la[i], lb[i], tolerance)) return false;
            }
            return true;
        }
        default:
            return false;
        }
    }

    void encode_value(util::ByteWriter& w, const Value& v) {
        w.put_u8(static_cast<uint8_t>(v.type()));
        switch (v.type()) {
        case Value::Type::Null:
            break;
        case Value::Type::Bool:
            w.put_u8(v.as_bool() ? 1 : 0);
            break;
        case Value::Type::Int:
            w.put_i64(v.as_int());
            break;
        case Value::Type::Double:
            w.put_f64(v.as_double());
            break;
        case Value::Type::String:
            w.put_string(v.as_string());
            break;
        case Value::Type::List:
            w.put_u32(static_cast<uint32_t>(v.as_list().size()));
            for (const auto& e : v.as_list()) {
                encode_value(w, e);
            }
            break;
        }
    }

    namespace {

        bool decode_value_depth(util::ByteReader& r, Value& v, int depth) {
            if (depth > kMaxDepth) return false;
            uint8_t tag;
            if (!r.get_u8(tag)) return false;
            switch (static_cast<Value::Type>(tag)) {
            case Value::Type::Null:
                v = Value();
                return true;
            case Value::Type::Bool: {
                uint8_t b;
                if (!r.get_u8(b)) return false;
                v = Value(b != 0);
                return true;
            }
            case Value::Type::Int: {
                int64_t i;
                if (!r.get_i64(i)) return false;
                v = Value(i);
                return true;
            }
            case Value::Type::Double: {
                double d;
                if (!r.get_f64(d)) return false;
                v = Value(d);
                return true;
            }
            case Value::Type::String: {
                std::string s;
                if (!r.get_string(s)) return false;
                v = Value(std::move(s));
                return true;
            }
            case Value::Type::List: {
                uint32_t n;
                if (!r.get_u32(n)) return false;
                // Each element takes at least its tag byte
                if (n > r.remaining()) return false;
                Value::List items;
                items.reserve(n);
                for (uint32_t i = 0; i < n; ++i) {
                    Value e;
                    if (!decode_value_depth(r, e, depth + 1)) return false;
                    items.push_back(std::move(e));
                }
                v = Value(std::move(items));
                return true;
            }
            }
            return false;
        }

    }

    bool decode_value(util::ByteReader& r, Value& v) {
        return decode_value_depth(r, v, 0);
    }

    void encode_payload(util::ByteWriter& w, const Payload& p) {
        w.put_u32(static_cast<uint32_t>(p.size()));
        for (const auto& kv : p) {
            w.put_string(kv.first);
            encode_value(w, kv.second);
        }
    }

    bool decode_payload(util::ByteReader& r, Payload& p) {
        uint32_t n;
        if (!r.get_u32(n)) return false;
        p.clear();
        for (uint32_t i = 0; i < n; ++i) {
            std::string field;
            Value v;
            if (!r.get_string(field) || !decode_value(r, v)) return false;
            p.emplace(std::move(field), std::move(v));
        }
        return true;
    }

} // namespace dualwrite
