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

#ifndef AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_CONDITION_EVALUATOR_H
#define AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_CONDITION_EVALUATOR_H

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "src/core/security/authorization/condition.h"

namespace authz_core {

// Returns true iff every clause of condition holds against context.
// A clause with an unknown operator, an attribute missing from context, or
// an attribute none of whose accepted values satisfies the operator makes
// the result false.  An empty condition holds.
bool EvaluateConditions(const ConditionContext& context,
                        const Condition& condition);

// Decodes condition_json and then context_json, and evaluates them.
// Decoding failures are returned as kInvalidArgument; everything else
// resolves to a boolean.
absl::StatusOr<bool> EvaluateConditions(absl::string_view context_json,
                                        absl::string_view condition_json);

}  // namespace authz_core

#endif  // AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_CONDITION_EVALUATOR_H
