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

#include "src/core/security/authorization/condition_evaluator.h"

#include "src/core/debug/trace.h"
#include "src/core/util/json/json_reader.h"
#include "src/core/util/json/json_writer.h"

namespace authz_core {

bool EvaluateConditions(const ConditionContext& context,
                        const Condition& condition) {
  for (const auto& entry : condition) {
    const ConditionClause& clause = entry.second;
    if (!clause.comparator.has_value()) {
      AUTHZ_TRACE_LOG(condition_eval, INFO)
          << "unknown operator " << clause.operator_name << ": deny";
      return false;
    }
    for (const auto& attribute : clause.values) {
      auto it = context.find(attribute.first);
      if (it == context.end()) {
        AUTHZ_TRACE_LOG(condition_eval, INFO)
            << clause.operator_name << ": attribute " << attribute.first
            << " missing from context: deny";
        return false;
      }
      if (!clause.comparator->Matches(it->second, attribute.second)) {
        AUTHZ_TRACE_LOG(condition_eval, INFO)
            << ConditionOperatorName(clause.comparator->op()) << ": "
            << attribute.first << "=\""
            << it->second.text() << "\" not satisfied: deny";
        return false;
      }
    }
  }
  AUTHZ_TRACE_LOG(condition_eval, INFO)
      << "all " << condition.size() << " clause(s) satisfied";
  return true;
}

absl::StatusOr<bool> EvaluateConditions(absl::string_view context_json,
                                        absl::string_view condition_json) {
  auto condition_doc = JsonParse(condition_json);
  if (!condition_doc.ok()) return condition_doc.status();
  auto condition = ParseCondition(*condition_doc);
  if (!condition.ok()) return condition.status();
  auto context_doc = JsonParse(context_json);
  if (!context_doc.ok()) return context_doc.status();
  auto context = ParseConditionContext(*context_doc);
  if (!context.ok()) return context.status();
  if (AUTHZ_TRACE_FLAG_ENABLED(condition_eval)) {
    LOG(INFO) << "evaluating " << condition->size()
              << " clause(s) against context "
              << JsonDump(ConditionContextToJson(*context));
  }
  return EvaluateConditions(*context, *condition);
}

}  // namespace authz_core
