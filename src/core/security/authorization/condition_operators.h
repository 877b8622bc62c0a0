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

#ifndef AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_CONDITION_OPERATORS_H
#define AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_CONDITION_OPERATORS_H

#include <stdint.h>

#include <optional>
#include <string>
#include <variant>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "src/core/security/authorization/attribute_value.h"

namespace authz_core {

enum class ConditionOperator {
  kStringEquals,
  kStringNotEquals,
  kStringEqualsIgnoreCase,
  kStringNotEqualsIgnoreCase,
  kStringLike,
  kStringNotLike,
  kNumericEquals,
  kNumericNotEquals,
  kNumericLessThan,
  kNumericLessThanEquals,
  kNumericGreaterThan,
  kNumericGreaterThanEquals,
  kDateEquals,
  kDateNotEquals,
  kDateLessThan,
  kDateLessThanEquals,
  kDateGreaterThan,
  kDateGreaterThanEquals,
  kBool,
  kIpAddress,
  kNotIpAddress,
};

// Operator names are case-sensitive, e.g. "StringEquals" or "IPAddress".
std::optional<ConditionOperator> ParseConditionOperator(absl::string_view name);
absl::string_view ConditionOperatorName(ConditionOperator op);

// Ordering relation shared by the numeric and date families.
enum class Relation {
  kEquals,
  kNotEquals,
  kLessThan,
  kLessThanEquals,
  kGreaterThan,
  kGreaterThanEquals,
};

// Case-sensitive or case-insensitive equality, or substring containment.
struct StringComparator {
  enum class Kind { kEquals, kEqualsIgnoreCase, kContains };
  Kind kind;
  bool negate;

  bool operator()(const AttributeValue& value,
                  absl::Span<const std::string> accepted) const;
};

// Both sides are parsed as 64-bit integers.  A side that does not parse
// never satisfies the relation.
struct IntegerComparator {
  Relation relation;

  bool operator()(const AttributeValue& value,
                  absl::Span<const std::string> accepted) const;
};

// Both sides are parsed as RFC3339 timestamps.  If either side does not
// parse the pair is treated as unordered and unequal: only kNotEquals is
// satisfied.
struct TimestampComparator {
  Relation relation;

  bool operator()(const AttributeValue& value,
                  absl::Span<const std::string> accepted) const;
};

// true/false/yes/no/1/0, case-insensitive.
struct BoolComparator {
  bool operator()(const AttributeValue& value,
                  absl::Span<const std::string> accepted) const;
};

// Each accepted value is tried as an address literal (equality) and then as
// a CIDR range (containment).  Values that are neither never match, and a
// context value that is not an address matches nothing.
struct IpComparator {
  bool negate;

  bool operator()(const AttributeValue& value,
                  absl::Span<const std::string> accepted) const;
};

// The comparison an operator performs, chosen once when a condition is
// decoded.  Matches() is true if any accepted value satisfies the operator.
class ConditionComparator {
 public:
  explicit ConditionComparator(ConditionOperator op);

  ConditionOperator op() const { return op_; }

  bool Matches(const AttributeValue& value,
               absl::Span<const std::string> accepted) const;

 private:
  using Comparator =
      std::variant<StringComparator, IntegerComparator, TimestampComparator,
                   BoolComparator, IpComparator>;

  static Comparator ComparatorFor(ConditionOperator op);

  ConditionOperator op_;
  Comparator comparator_;
};

}  // namespace authz_core

#endif  // AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_CONDITION_OPERATORS_H
