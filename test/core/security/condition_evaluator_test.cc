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

#include "src/core/security/authorization/condition_evaluator.h"

#include <string>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "src/core/debug/trace.h"
#include "src/core/util/json/json_reader.h"
#include "src/core/util/json/json_writer.h"

namespace authz_core {
namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

struct EvaluationCase {
  const char* name;
  const char* context;
  const char* condition;
  bool expected;
};

class ConditionEvaluatorTest
    : public ::testing::TestWithParam<EvaluationCase> {};

TEST_P(ConditionEvaluatorTest, Evaluate) {
  const EvaluationCase& c = GetParam();
  auto result = EvaluateConditions(c.context, c.condition);
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(*result, c.expected)
      << "context: " << c.context << "\ncondition: " << c.condition;
}

INSTANTIATE_TEST_SUITE_P(
    Policies, ConditionEvaluatorTest,
    ::testing::Values(
        EvaluationCase{"IpExact", R"({"acs:SourceIp": "10.0.0.1"})",
                       R"({"IPAddress": {"acs:SourceIp":
                           ["10.0.0.1", "192.168.1.1"]}})",
                       true},
        EvaluationCase{"IpCidr", R"({"acs:SourceIp": "192.168.234.50"})",
                       R"({"IPAddress": {"acs:SourceIp":
                           ["192.168.234.0/24"]}})",
                       true},
        EvaluationCase{"IpOutsideCidr", R"({"acs:SourceIp": "203.0.113.9"})",
                       R"({"IPAddress": {"acs:SourceIp":
                           ["192.168.234.0/24"]}})",
                       false},
        EvaluationCase{"IpNoMatch", R"({"acs:SourceIp": "127.0.0.1"})",
                       R"({"IPAddress": {"acs:SourceIp":
                           ["10.0.0.1", "192.168.234.0/24"]}})",
                       false},
        EvaluationCase{"DateBefore",
                       R"({"acs:CurrentTime": "2024-01-10T00:00:00Z"})",
                       R"({"DateLessThan": {"acs:CurrentTime":
                           ["2024-01-12T06:59:00Z"]}})",
                       true},
        EvaluationCase{"DateAfter",
                       R"({"acs:CurrentTime": "2024-01-15T00:00:00Z"})",
                       R"({"DateLessThan": {"acs:CurrentTime":
                           ["2024-01-12T06:59:00Z"]}})",
                       false},
        EvaluationCase{"DateNotBeforeEarlierValue",
                       R"({"acs:CurrentTime": "2024-01-10T00:00:00Z"})",
                       R"({"DateLessThan": {"acs:CurrentTime":
                           ["2024-01-05T00:00:00Z"]}})",
                       false},
        EvaluationCase{"StringEquals", R"({"acs:UserRole": "admin"})",
                       R"({"StringEquals": {"acs:UserRole":
                           ["admin", "superuser"]}})",
                       true},
        EvaluationCase{"StringNotInList", R"({"acs:UserRole": "guest"})",
                       R"({"StringEquals": {"acs:UserRole":
                           ["admin", "superuser"]}})",
                       false},
        EvaluationCase{"AllClausesHold",
                       R"({"acs:SourceIp": "10.0.0.1",
                           "acs:CurrentTime": "2024-01-10T00:00:00Z"})",
                       R"({"IPAddress": {"acs:SourceIp": ["10.0.0.1"]},
                           "DateLessThan": {"acs:CurrentTime":
                               ["2024-01-12T00:00:00Z"]}})",
                       true},
        EvaluationCase{"OneClauseFails",
                       R"({"acs:SourceIp": "10.0.0.1",
                           "acs:CurrentTime": "2024-01-15T00:00:00Z"})",
                       R"({"IPAddress": {"acs:SourceIp": ["10.0.0.1"]},
                           "DateLessThan": {"acs:CurrentTime":
                               ["2024-01-12T00:00:00Z"]}})",
                       false},
        EvaluationCase{"AllAttributesInBlockMustHold",
                       R"({"a": "x", "b": "y"})",
                       R"({"StringEquals": {"a": ["x"], "b": ["z"]}})",
                       false},
        EvaluationCase{"MissingAttribute", R"({"acs:SourceIp": "10.0.0.1"})",
                       R"({"DateLessThan": {"acs:CurrentTime":
                           ["2024-01-12T00:00:00Z"]}})",
                       false},
        EvaluationCase{"UnknownOperator", R"({"k": "v"})",
                       R"({"StringMatches": {"k": ["v"]}})", false},
        EvaluationCase{"UnknownOperatorNextToSatisfiedOne", R"({"k": "v"})",
                       R"({"StringEquals": {"k": ["v"]},
                           "stringequals": {"k": ["v"]}})",
                       false},
        EvaluationCase{"EmptyCondition", R"({"k": "v"})", "{}", true},
        EvaluationCase{"NullCondition", R"({"k": "v"})", "null", true},
        EvaluationCase{"EmptyBlock", "{}", R"({"StringEquals": {}})", true},
        EvaluationCase{"EmptyValueList", R"({"k": "v"})",
                       R"({"StringEquals": {"k": []}})", false},
        EvaluationCase{"NullValueList", R"({"k": "v"})",
                       R"({"StringEquals": {"k": null}})", false},
        EvaluationCase{"NullContext", "null",
                       R"({"StringEquals": {"k": ["v"]}})", false},
        EvaluationCase{"NumberInContext", R"({"acs:Count": 10})",
                       R"({"NumericLessThan": {"acs:Count": ["20"]}})", true},
        EvaluationCase{"BoolInContext", R"({"acs:MFAPresent": true})",
                       R"({"Bool": {"acs:MFAPresent": ["true"]}})", true},
        EvaluationCase{"BoolSeenByStringOperator",
                       R"({"acs:MFAPresent": false})",
                       R"({"StringEquals": {"acs:MFAPresent": ["false"]}})",
                       true}),
    [](const ::testing::TestParamInfo<EvaluationCase>& info) {
      return std::string(info.param.name);
    });

TEST(ConditionEvaluatorErrorTest, InvalidContextJson) {
  auto result = EvaluateConditions("{invalid json}",
                                   R"({"StringEquals":{"key":["value"]}})");
  EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(result.status().message(), StartsWith("JSON parsing failed"));
}

TEST(ConditionEvaluatorErrorTest, InvalidConditionJson) {
  auto result = EvaluateConditions(R"({"key":"value"})", "{invalid json}");
  EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(result.status().message(), StartsWith("JSON parsing failed"));
}

TEST(ConditionEvaluatorErrorTest, ConditionIsDecodedFirst) {
  auto result = EvaluateConditions("{invalid json}", R"({"StringEquals": 1})");
  EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(result.status().message(),
              StartsWith("condition StringEquals: is not an object"));
}

TEST(ConditionEvaluatorErrorTest, UnknownOperatorStillNeedsValidJson) {
  auto result = EvaluateConditions("[", R"({"NoSuchOperator": {}})");
  EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ConditionEvaluatorErrorTest, WrongConditionShapes) {
  for (const char* condition :
       {R"([])", R"("StringEquals")", R"({"StringEquals": {"k": "v"}})",
        R"({"StringEquals": {"k": [1]}})",
        R"({"StringEquals": {"k": ["v", null]}})"}) {
    auto result = EvaluateConditions(R"({"k": "v"})", condition);
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument)
        << condition;
  }
}

TEST(ConditionEvaluatorErrorTest, WrongContextShapes) {
  for (const char* context :
       {R"([])", R"("v")", R"({"k": null})", R"({"k": ["v"]})",
        R"({"k": {"nested": "v"}})"}) {
    auto result =
        EvaluateConditions(context, R"({"StringEquals": {"k": ["v"]}})");
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument)
        << context;
    EXPECT_THAT(result.status().message(), HasSubstr("context")) << context;
  }
}

TEST(ConditionDecodingTest, ParseCondition) {
  auto json = JsonParse(R"({"IPAddress": {"inf:SourceIP": ["10.0.0.0/8"]},
                            "Custom": {"k": ["v"]}})");
  ASSERT_TRUE(json.ok()) << json.status();
  auto condition = ParseCondition(*json);
  ASSERT_TRUE(condition.ok()) << condition.status();
  ASSERT_EQ(condition->size(), 2u);
  const ConditionClause& ip = condition->at("IPAddress");
  ASSERT_TRUE(ip.comparator.has_value());
  EXPECT_EQ(ip.comparator->op(), ConditionOperator::kIpAddress);
  EXPECT_THAT(ip.values.at("inf:SourceIP"),
              ::testing::ElementsAre("10.0.0.0/8"));
  EXPECT_FALSE(condition->at("Custom").comparator.has_value());
}

TEST(ConditionDecodingTest, ContextRoundTripsThroughJson) {
  auto json = JsonParse(R"({"s": "x", "n": 42, "b": true})");
  ASSERT_TRUE(json.ok()) << json.status();
  auto context = ParseConditionContext(*json);
  ASSERT_TRUE(context.ok()) << context.status();
  EXPECT_EQ(context->at("n").type(), AttributeValue::Type::kNumber);
  EXPECT_EQ(context->at("n").text(), "42");
  EXPECT_TRUE(context->at("b").boolean());
  EXPECT_EQ(JsonDump(ConditionContextToJson(*context)),
            R"({"b":true,"n":42,"s":"x"})");
}

TEST(ConditionEvaluatorTest, NumericValuesMustBePlainDecimal) {
  auto result = EvaluateConditions(R"({"n": "+5"})",
                                   R"({"NumericEquals": {"n": [" 5"]}})");
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_FALSE(*result);
  result = EvaluateConditions(R"({"n": 5})",
                              R"({"NumericEquals": {"n": ["5"]}})");
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_TRUE(*result);
}

TEST(ConditionEvaluatorTracingTest, SameResultsWithTracingEnabled) {
  SavedTraceFlags saved;
  ASSERT_TRUE(ParseTracers("condition_eval"));
  const char* context = R"({"inf:SourceIP": "10.1.2.3", "acs:Count": 3})";
  EXPECT_EQ(*EvaluateConditions(
                context, R"({"IPAddress": {"inf:SourceIP": ["10.0.0.0/8"]}})"),
            true);
  const char* ranges =
      R"({"IPAddress": {"inf:SourceIP": ["bad/8", "192.0.2.0/24"]}})";
  EXPECT_EQ(*EvaluateConditions(context, ranges), false);
  EXPECT_EQ(*EvaluateConditions(
                context, R"({"NumericLessThan": {"acs:Count": ["2"]}})"),
            false);
  EXPECT_EQ(*EvaluateConditions(context, R"({"NoSuchOp": {"k": ["v"]}})"),
            false);
  saved.Restore();
}

TEST(ConditionEvaluatorTypedTest, EvaluatesDecodedInputs) {
  ConditionContext context;
  context.emplace("inf:SourceIP", AttributeValue::FromString("10.1.2.3"));
  context.emplace("acs:Count", AttributeValue::FromNumber(3));
  Condition condition;
  ConditionClause ip;
  ip.operator_name = "IPAddress";
  ip.comparator.emplace(ConditionOperator::kIpAddress);
  ip.values["inf:SourceIP"] = {"10.0.0.0/8"};
  condition.emplace(ip.operator_name, ip);
  EXPECT_TRUE(EvaluateConditions(context, condition));
  ConditionClause count;
  count.operator_name = "NumericGreaterThan";
  count.comparator.emplace(ConditionOperator::kNumericGreaterThan);
  count.values["acs:Count"] = {"5"};
  condition.emplace(count.operator_name, count);
  EXPECT_FALSE(EvaluateConditions(context, condition));
}

}  // namespace
}  // namespace authz_core

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
