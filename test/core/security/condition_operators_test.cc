// Copyright 2024 gRPC authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "src/core/security/authorization/condition_operators.h"

#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "gtest/gtest.h"

namespace authz_core {
namespace {

bool Eval(ConditionOperator op, const AttributeValue& value,
          std::vector<std::string> accepted) {
  return ConditionComparator(op).Matches(value, accepted);
}

bool Eval(ConditionOperator op, const char* value,
          std::vector<std::string> accepted) {
  return Eval(op, AttributeValue::FromString(value), std::move(accepted));
}

TEST(ConditionOperatorTest, NamesRoundTrip) {
  const char* kNames[] = {
      "StringEquals",          "StringNotEquals",
      "StringEqualsIgnoreCase", "StringNotEqualsIgnoreCase",
      "StringLike",            "StringNotLike",
      "NumericEquals",         "NumericNotEquals",
      "NumericLessThan",       "NumericLessThanEquals",
      "NumericGreaterThan",    "NumericGreaterThanEquals",
      "DateEquals",            "DateNotEquals",
      "DateLessThan",          "DateLessThanEquals",
      "DateGreaterThan",       "DateGreaterThanEquals",
      "Bool",                  "IPAddress",
      "NotIPAddress",
  };
  for (const char* name : kNames) {
    auto op = ParseConditionOperator(name);
    ASSERT_TRUE(op.has_value()) << name;
    EXPECT_EQ(ConditionOperatorName(*op), name);
  }
  EXPECT_EQ(ParseConditionOperator("stringequals"), std::nullopt);
  EXPECT_EQ(ParseConditionOperator("IpAddress"), std::nullopt);
  EXPECT_EQ(ParseConditionOperator(""), std::nullopt);
}

TEST(ConditionOperatorTest, StringEquality) {
  EXPECT_TRUE(Eval(ConditionOperator::kStringEquals, "admin",
                   {"guest", "admin"}));
  EXPECT_FALSE(Eval(ConditionOperator::kStringEquals, "Admin", {"admin"}));
  EXPECT_TRUE(
      Eval(ConditionOperator::kStringEqualsIgnoreCase, "Admin", {"ADMIN"}));
  EXPECT_FALSE(
      Eval(ConditionOperator::kStringEqualsIgnoreCase, "Admin", {"admins"}));
  EXPECT_TRUE(Eval(ConditionOperator::kStringNotEquals, "guest", {"admin"}));
  EXPECT_FALSE(Eval(ConditionOperator::kStringNotEquals, "admin", {"admin"}));
  EXPECT_FALSE(
      Eval(ConditionOperator::kStringNotEqualsIgnoreCase, "ADMIN", {"admin"}));
}

TEST(ConditionOperatorTest, NegatedOperatorsAreSatisfiedByAnyValue) {
  // One accepted value differing from the context value is enough.
  EXPECT_TRUE(Eval(ConditionOperator::kStringNotEquals, "admin",
                   {"admin", "guest"}));
  EXPECT_TRUE(Eval(ConditionOperator::kNotIpAddress, "10.0.0.1",
                   {"10.0.0.1", "192.168.0.0/16"}));
}

TEST(ConditionOperatorTest, StringLikeIsSubstring) {
  EXPECT_TRUE(Eval(ConditionOperator::kStringLike, "ecs:DescribeInstances",
                   {"Describe"}));
  // Not a wildcard match.
  EXPECT_FALSE(Eval(ConditionOperator::kStringLike, "ecs:DescribeInstances",
                    {"ecs:*"}));
  EXPECT_TRUE(Eval(ConditionOperator::kStringNotLike, "ecs:DescribeInstances",
                   {"Create"}));
  EXPECT_FALSE(Eval(ConditionOperator::kStringNotLike,
                    "ecs:DescribeInstances", {"Describe"}));
}

TEST(ConditionOperatorTest, Numeric) {
  AttributeValue ten = AttributeValue::FromNumber(10);
  EXPECT_TRUE(Eval(ConditionOperator::kNumericEquals, ten, {"10"}));
  EXPECT_TRUE(Eval(ConditionOperator::kNumericNotEquals, ten, {"11"}));
  EXPECT_TRUE(Eval(ConditionOperator::kNumericLessThan, ten, {"11"}));
  EXPECT_FALSE(Eval(ConditionOperator::kNumericLessThan, ten, {"10"}));
  EXPECT_TRUE(Eval(ConditionOperator::kNumericLessThanEquals, ten, {"10"}));
  EXPECT_TRUE(Eval(ConditionOperator::kNumericGreaterThan, ten, {"-3"}));
  EXPECT_FALSE(Eval(ConditionOperator::kNumericGreaterThan, ten, {"10"}));
  EXPECT_TRUE(
      Eval(ConditionOperator::kNumericGreaterThanEquals, ten, {"10"}));
  // Numbers written as strings are accepted too.
  EXPECT_TRUE(Eval(ConditionOperator::kNumericEquals, "42", {"42"}));
  EXPECT_TRUE(Eval(ConditionOperator::kNumericEquals, "9223372036854775807",
                   {"9223372036854775807"}));
}

TEST(ConditionOperatorTest, NumericParseFailuresNeverMatch) {
  EXPECT_FALSE(Eval(ConditionOperator::kNumericEquals, "1.5", {"1.5"}));
  EXPECT_FALSE(Eval(ConditionOperator::kNumericNotEquals, "abc", {"1"}));
  EXPECT_FALSE(Eval(ConditionOperator::kNumericNotEquals, "1", {"abc"}));
  EXPECT_TRUE(Eval(ConditionOperator::kNumericEquals, "1", {"abc", "1"}));
  EXPECT_FALSE(Eval(ConditionOperator::kNumericEquals,
                    AttributeValue::FromBool(true), {"1"}));
}

TEST(ConditionOperatorTest, NumericRequiresPlainDecimal) {
  EXPECT_FALSE(Eval(ConditionOperator::kNumericEquals, "+5", {" 5"}));
  EXPECT_FALSE(Eval(ConditionOperator::kNumericEquals, "+5", {"5"}));
  EXPECT_FALSE(Eval(ConditionOperator::kNumericEquals, "5", {" 5"}));
  EXPECT_FALSE(Eval(ConditionOperator::kNumericEquals, "5 ", {"5"}));
  EXPECT_FALSE(Eval(ConditionOperator::kNumericNotEquals, "-", {"1"}));
  EXPECT_FALSE(Eval(ConditionOperator::kNumericNotEquals, "--1", {"1"}));
  EXPECT_TRUE(Eval(ConditionOperator::kNumericEquals, "-5", {"-5"}));
  EXPECT_TRUE(Eval(ConditionOperator::kNumericEquals, "007", {"7"}));
}

TEST(ConditionOperatorTest, Date) {
  const char* now = "2024-01-10T00:00:00Z";
  EXPECT_TRUE(Eval(ConditionOperator::kDateLessThan, now,
                   {"2024-01-12T06:59:00Z"}));
  EXPECT_FALSE(Eval(ConditionOperator::kDateLessThan, now,
                    {"2024-01-05T00:00:00Z"}));
  EXPECT_TRUE(Eval(ConditionOperator::kDateLessThanEquals, now, {now}));
  EXPECT_TRUE(Eval(ConditionOperator::kDateGreaterThan, now,
                   {"2024-01-05T00:00:00Z"}));
  EXPECT_TRUE(Eval(ConditionOperator::kDateGreaterThanEquals, now, {now}));
  EXPECT_TRUE(Eval(ConditionOperator::kDateNotEquals, now,
                   {"2024-01-10T00:00:01Z"}));
  // Offsets are honoured.
  EXPECT_TRUE(Eval(ConditionOperator::kDateEquals, now,
                   {"2024-01-10T08:00:00+08:00"}));
  EXPECT_TRUE(Eval(ConditionOperator::kDateLessThan,
                   "2024-01-10T00:00:00.5Z", {"2024-01-10T00:00:01Z"}));
}

TEST(ConditionOperatorTest, UnparsableDatesAreUnequalAndUnordered) {
  for (const char* context : {"yesterday", "2024-01-10T00:00:00Z"}) {
    const char* accepted = absl::string_view(context) == "yesterday"
                               ? "2024-01-10T00:00:00Z"
                               : "2024-01-10";
    EXPECT_TRUE(Eval(ConditionOperator::kDateNotEquals, context, {accepted}))
        << context;
    for (ConditionOperator op :
         {ConditionOperator::kDateEquals, ConditionOperator::kDateLessThan,
          ConditionOperator::kDateLessThanEquals,
          ConditionOperator::kDateGreaterThan,
          ConditionOperator::kDateGreaterThanEquals}) {
      EXPECT_FALSE(Eval(op, context, {accepted}))
          << ConditionOperatorName(op) << " " << context;
    }
  }
}

TEST(ConditionOperatorTest, Bool) {
  EXPECT_TRUE(
      Eval(ConditionOperator::kBool, AttributeValue::FromBool(true), {"true"}));
  EXPECT_FALSE(
      Eval(ConditionOperator::kBool, AttributeValue::FromBool(true), {"false"}));
  EXPECT_TRUE(Eval(ConditionOperator::kBool, "TRUE", {"yes"}));
  EXPECT_TRUE(Eval(ConditionOperator::kBool, "0", {"false"}));
  EXPECT_FALSE(Eval(ConditionOperator::kBool, "maybe", {"true", "false"}));
  EXPECT_FALSE(Eval(ConditionOperator::kBool, "true", {"maybe"}));
}

TEST(ConditionOperatorTest, IpAddress) {
  EXPECT_TRUE(Eval(ConditionOperator::kIpAddress, "10.0.0.1",
                   {"10.0.0.1", "192.168.1.1"}));
  EXPECT_TRUE(Eval(ConditionOperator::kIpAddress, "192.168.234.50",
                   {"192.168.234.0/24"}));
  EXPECT_FALSE(Eval(ConditionOperator::kIpAddress, "203.0.113.9",
                    {"192.168.234.0/24"}));
  EXPECT_TRUE(Eval(ConditionOperator::kIpAddress, "2001:db8::7",
                   {"2001:db8::/32"}));
  EXPECT_TRUE(
      Eval(ConditionOperator::kIpAddress, "::ffff:10.0.0.1", {"10.0.0.1"}));
  EXPECT_TRUE(Eval(ConditionOperator::kIpAddress, "10.0.0.1",
                   {"::ffff:10.0.0.0/104"}));
  EXPECT_FALSE(Eval(ConditionOperator::kNotIpAddress, "10.0.0.1",
                    {"::ffff:10.0.0.0/104"}));
}

TEST(ConditionOperatorTest, NotIpAddress) {
  EXPECT_TRUE(Eval(ConditionOperator::kNotIpAddress, "10.0.0.1",
                   {"192.168.0.0/16"}));
  EXPECT_FALSE(
      Eval(ConditionOperator::kNotIpAddress, "10.0.0.1", {"10.0.0.0/8"}));
  EXPECT_FALSE(
      Eval(ConditionOperator::kNotIpAddress, "10.0.0.1", {"10.0.0.1"}));
}

TEST(ConditionOperatorTest, IpParseFailuresNeverMatch) {
  for (ConditionOperator op :
       {ConditionOperator::kIpAddress, ConditionOperator::kNotIpAddress}) {
    EXPECT_FALSE(Eval(op, "not-an-ip", {"10.0.0.0/8"}))
        << ConditionOperatorName(op);
    EXPECT_FALSE(Eval(op, "10.0.0.1", {"garbage", "10.0.0.0/40"}))
        << ConditionOperatorName(op);
  }
}

TEST(ConditionOperatorTest, EmptyAcceptedListNeverMatches) {
  EXPECT_FALSE(Eval(ConditionOperator::kStringNotEquals, "x", {}));
  EXPECT_FALSE(Eval(ConditionOperator::kDateNotEquals, "bad", {}));
  EXPECT_FALSE(Eval(ConditionOperator::kNotIpAddress, "10.0.0.1", {}));
}

}  // namespace
}  // namespace authz_core

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
