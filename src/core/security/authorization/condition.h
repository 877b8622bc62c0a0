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

#ifndef AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_CONDITION_H
#define AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_CONDITION_H

#include <authz/support/json.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "src/core/security/authorization/attribute_value.h"
#include "src/core/security/authorization/condition_operators.h"

namespace authz_core {

// Attribute name to the values accepted for it.
using ConditionValue = std::map<std::string, std::vector<std::string>>;

// One operator block of a condition, e.g.
// "IPAddress": {"inf:SourceIP": ["10.0.0.0/8"]}.
struct ConditionClause {
  std::string operator_name;
  // Unset when operator_name is not a known operator.  Such a clause never
  // holds.
  std::optional<ConditionComparator> comparator;
  ConditionValue values;
};

// Operator name to its clause.  All clauses must hold.
using Condition = std::map<std::string, ConditionClause>;

// Decodes {"<Operator>": {"<attribute>": ["<value>", ...]}, ...}.
// A null root or a null attribute list decodes as empty.
absl::StatusOr<Condition> ParseCondition(const Json& json);

// Decodes {"<attribute>": <string|number|bool>, ...}.  A null root
// decodes as an empty context.
absl::StatusOr<ConditionContext> ParseConditionContext(const Json& json);

Json ConditionContextToJson(const ConditionContext& context);

}  // namespace authz_core

#endif  // AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_CONDITION_H
