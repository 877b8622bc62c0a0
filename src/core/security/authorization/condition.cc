// Copyright 2021 gRPC authors.
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

#include "src/core/security/authorization/condition.h"

#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"

namespace authz_core {

namespace {

absl::StatusOr<std::vector<std::string>> ParseAcceptedValues(
    absl::string_view op, absl::string_view attribute, const Json& json) {
  std::vector<std::string> values;
  if (json.is_null()) return values;
  const Json::Array* array = json.as_array();
  if (array == nullptr) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "condition %s.%s: is not an array.", op, attribute));
  }
  for (size_t i = 0; i < array->size(); ++i) {
    const std::string* element = (*array)[i].as_string();
    if (element == nullptr) {
      return absl::InvalidArgumentError(
          absl::StrFormat("condition %s.%s[%d]: is not a string, got %v.", op,
                          attribute, i, (*array)[i].type()));
    }
    values.push_back(*element);
  }
  return values;
}

absl::StatusOr<ConditionClause> ParseClause(const std::string& op,
                                            const Json& json) {
  ConditionClause clause;
  clause.operator_name = op;
  std::optional<ConditionOperator> parsed = ParseConditionOperator(op);
  if (parsed.has_value()) clause.comparator.emplace(*parsed);
  if (json.is_null()) return clause;
  const Json::Object* attributes = json.as_object();
  if (attributes == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrFormat("condition %s: is not an object.", op));
  }
  for (const auto& entry : *attributes) {
    auto values = ParseAcceptedValues(op, entry.first, entry.second);
    if (!values.ok()) return values.status();
    clause.values.emplace(entry.first, std::move(*values));
  }
  return clause;
}

}  // namespace

absl::StatusOr<Condition> ParseCondition(const Json& json) {
  Condition condition;
  if (json.is_null()) return condition;
  const Json::Object* clauses = json.as_object();
  if (clauses == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrFormat("condition: is not an object, got %v.", json.type()));
  }
  for (const auto& entry : *clauses) {
    auto clause = ParseClause(entry.first, entry.second);
    if (!clause.ok()) return clause.status();
    condition.emplace(entry.first, std::move(*clause));
  }
  return condition;
}

absl::StatusOr<ConditionContext> ParseConditionContext(const Json& json) {
  ConditionContext context;
  if (json.is_null()) return context;
  const Json::Object* attributes = json.as_object();
  if (attributes == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrFormat("context: is not an object, got %v.", json.type()));
  }
  for (const auto& entry : *attributes) {
    auto value = AttributeValue::FromJson(entry.second);
    if (!value.has_value()) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "context %s: must be a string, number or boolean, got %v.",
          entry.first, entry.second.type()));
    }
    context.emplace(entry.first, std::move(*value));
  }
  return context;
}

Json ConditionContextToJson(const ConditionContext& context) {
  Json::Object object;
  for (const auto& entry : context) {
    object.emplace(entry.first, entry.second.ToJson());
  }
  return Json::FromObject(std::move(object));
}

}  // namespace authz_core
