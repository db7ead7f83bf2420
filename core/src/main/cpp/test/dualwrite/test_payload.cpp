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

#include <gtest/gtest.h>
#include "dualwrite/payload.h"
#include "dualwrite/types.h"
#include "dualwrite/entity_registry.h"
#include "util/uuid.h"

#include <limits>

using namespace dualwrite;

namespace {
    constexpr double kTolerance = 0.005;
}

TEST(PayloadTest, NumericToleranceIsAbsolute) {
    EXPECT_TRUE(values_equivalent(Value(19.99), Value(19.994), kTolerance));
    EXPECT_TRUE(values_equivalent(Value(19.99), Value(19.995), kTolerance));
    EXPECT_FALSE(values_equivalent(Value(19.99), Value(20.0), kTolerance));
    EXPECT_FALSE(values_equivalent(Value(1000000.0), Value(1000000.01), kTolerance));
}

TEST(PayloadTest, IntAndDoubleCompareNumerically) {
    EXPECT_TRUE(values_equivalent(Value(20), Value(20.0), kTolerance));
    EXPECT_TRUE(values_equivalent(Value(int64_t(9007199254740993LL)), Value(int64_t(9007199254740993LL)), 0.0));
    EXPECT_FALSE(values_equivalent(Value(3), Value(4), kTolerance));
    // Exact equality keeps the tag
    EXPECT_NE(Value(20), Value(20.0));
}

TEST(PayloadTest, LargeIntegersCompareExactly) {
    Value a(int64_t(9007199254740993LL));
    Value b(int64_t(9007199254740992LL));
    EXPECT_FALSE(values_equivalent(a, b, 0.0));
    EXPECT_FALSE(values_equivalent(a, b, kTolerance));
    EXPECT_TRUE(values_equivalent(a, b, 1.0));
    EXPECT_FALSE(values_equivalent(Value(std::numeric_limits<int64_t>::max()),
                                   Value(std::numeric_limits<int64_t>::min()), 1.0));
}

TEST(PayloadTest, StringsAreTrimmed) {
    EXPECT_TRUE(values_equivalent(Value("  Jane Doe "), Value("Jane Doe"), kTolerance));
    EXPECT_TRUE(values_equivalent(Value("\tSKU-1\n"), Value("SKU-1"), kTolerance));
    EXPECT_FALSE(values_equivalent(Value("jane doe"), Value("Jane Doe"), kTolerance));
    EXPECT_EQ(normalized(Value("  x  ")), Value("x"));
}

TEST(PayloadTest, MismatchedTypesDiffer) {
    EXPECT_TRUE(values_equivalent(Value(), Value(nullptr), kTolerance));
    EXPECT_FALSE(values_equivalent(Value(), Value(""), kTolerance));
    EXPECT_FALSE(values_equivalent(Value(true), Value(1), kTolerance));
    EXPECT_FALSE(values_equivalent(Value("1"), Value(1), kTolerance));
}

TEST(PayloadTest, ListsCompareElementWise) {
    Value a(Value::List{Value(1), Value(" a "), Value(2.0)});
    Value b(Value::List{Value(1.001), Value("a"), Value(2)});
    Value c(Value::List{Value(1), Value("a")});
    EXPECT_TRUE(values_equivalent(a, b, kTolerance));
    EXPECT_FALSE(values_equivalent(a, c, kTolerance));
}

TEST(PayloadTest, Rendering) {
    Payload p{{"name", "Jane \"JD\""}, {"qty", 2}, {"active", true}, {"note", Value()}};
    std::string s = payload_to_string(p);
    EXPECT_NE(s.find("\"qty\": 2"), std::string::npos) << s;
    EXPECT_NE(s.find("\"active\": true"), std::string::npos) << s;
    EXPECT_NE(s.find("\"note\": null"), std::string::npos) << s;
    EXPECT_NE(s.find("\\\"JD\\\""), std::string::npos) << s;
    EXPECT_STREQ(value_type_name(Value::Type::Double), "double");
}

TEST(PayloadTest, CodecPreservesTypes) {
    Payload p{{"i", int64_t(-7)}, {"d", 0.1}, {"s", "ü"}, {"b", false}, {"n", Value()},
              {"l", Value::List{Value(1), Value(Value::List{Value("nested")})}}};
    util::ByteWriter w;
    encode_payload(w, p);
    util::ByteReader r(w.bytes().data(), w.size());
    Payload out;
    ASSERT_TRUE(decode_payload(r, out));
    EXPECT_TRUE(r.at_end());
    EXPECT_EQ(out, p);
    EXPECT_EQ(out.at("i").type(), Value::Type::Int);
    EXPECT_EQ(out.at("d").type(), Value::Type::Double);
}

TEST(PayloadTest, DecodeRejectsTruncatedInput) {
    Payload p{{"name", "a fairly long string value"}};
    util::ByteWriter w;
    encode_payload(w, p);
    std::vector<uint8_t> bytes = w.bytes();
    bytes.resize(bytes.size() - 4);
    util::ByteReader r(bytes.data(), bytes.size());
    Payload out;
    EXPECT_FALSE(decode_payload(r, out));
}

TEST(PayloadTest, DecodeRejectsExcessiveNesting) {
    Value v(1);
    for (int i = 0; i < 64; i++) {
        v = Value(Value::List{v});
    }
    util::ByteWriter w;
    encode_value(w, v);
    util::ByteReader r(w.bytes().data(), w.size());
    Value out;
    EXPECT_FALSE(decode_value(r, out));
}

TEST(TypesTest, OperationCodec) {
    Operation op = Operation::make("cart_item", "ci-9", OpKind::Update, Payload{{"qty", 3}});
    EXPECT_EQ(op.key().str(), "cart_item/ci-9");
    EXPECT_FALSE(op.operation_id.is_nil());

    util::ByteWriter w;
    encode_operation(w, op);
    util::ByteReader r(w.bytes().data(), w.size());
    Operation out;
    ASSERT_TRUE(decode_operation(r, out));
    EXPECT_EQ(out.operation_id, op.operation_id);
    EXPECT_EQ(out.key(), op.key());
    EXPECT_EQ(out.kind, OpKind::Update);
    EXPECT_EQ(out.payload, op.payload);
    EXPECT_EQ(to_micros(out.submitted_at), to_micros(op.submitted_at));
}

TEST(TypesTest, ResultDescribe) {
    DualWriteResult res;
    res.operation_id = util::random_uuid();
    res.overall = OverallStatus::PartialSuccess;
    res.primary.store = StoreRole::Primary;
    res.primary.status = WriteStatus::Success;
    WriteOutcome sec;
    sec.store = StoreRole::Secondary;
    sec.status = WriteStatus::Failed;
    sec.error_code = ErrorCode::Unavailable;
    sec.error = "connection refused";
    res.secondary = sec;
    res.retry_scheduled = true;

    std::string s = res.describe();
    EXPECT_NE(s.find(overall_name(OverallStatus::PartialSuccess)), std::string::npos) << s;
    EXPECT_NE(s.find("connection refused"), std::string::npos) << s;
    EXPECT_NE(s.find(util::uuid_string(res.operation_id)), std::string::npos) << s;
}

TEST(EntityRegistryTest, RegisterAndLookup) {
    EntityRegistry reg;
    reg.register_type(EntitySpec{"user", {"email", "name"}, {}, {}});
    reg.register_type(EntitySpec{"cart", {}, {}, {"updated_at"}});
    EXPECT_TRUE(reg.contains("user"));
    EXPECT_FALSE(reg.contains("order"));
    EXPECT_EQ(reg.types(), (std::vector<std::string>{"user", "cart"}));
    EXPECT_EQ(reg.get("user").parity_fields.size(), 2u);
    EXPECT_THROW(reg.get("order"), std::invalid_argument);
    EXPECT_THROW(reg.register_type(EntitySpec{"user", {}, {}, {}}), std::invalid_argument);
    EXPECT_THROW(reg.register_type(EntitySpec{"", {}, {}, {}}), std::invalid_argument);
}

TEST(EntityRegistryTest, ParityFieldsWithRenames) {
    EntitySpec spec{"user", {"email", "display_name", "updated_at"},
                    {{"display_name", "full_name"}}, {"updated_at"}};
    std::vector<FieldPair> pairs = EntityRegistry::comparison_fields(spec, nullptr, nullptr);
    ASSERT_EQ(pairs.size(), 2u);
    EXPECT_EQ(pairs[0].primary_field, "email");
    EXPECT_EQ(pairs[0].secondary_field, "email");
    EXPECT_EQ(pairs[1].primary_field, "display_name");
    EXPECT_EQ(pairs[1].secondary_field, "full_name");
}

TEST(EntityRegistryTest, UnionOfFieldsWhenNoParitySet) {
    EntitySpec spec{"cart", {}, {{"total", "cart_total"}}, {"version"}};
    Payload primary{{"total", 10}, {"user_id", "u1"}, {"version", 3}};
    Payload secondary{{"cart_total", 10}, {"legacy_flag", true}};
    std::vector<FieldPair> pairs = EntityRegistry::comparison_fields(spec, &primary, &secondary);

    std::vector<std::string> names;
    for (const auto& p : pairs) names.push_back(p.primary_field + "->" + p.secondary_field);
    EXPECT_EQ(names, (std::vector<std::string>{"legacy_flag->legacy_flag", "total->cart_total",
                                               "user_id->user_id"}));
}
