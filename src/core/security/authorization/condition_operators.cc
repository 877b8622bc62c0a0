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

#include "src/core/security/authorization/condition_operators.h"

#include <string>

#include "absl/algorithm/container.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/strip.h"
#include "absl/time/time.h"
#include "src/core/address_utils/ip_address.h"
#include "src/core/debug/trace.h"

namespace authz_core {

namespace {

struct OperatorName {
  ConditionOperator op;
  absl::string_view name;
};

constexpr OperatorName kOperatorNames[] = {
    {ConditionOperator::kStringEquals, "StringEquals"},
    {ConditionOperator::kStringNotEquals, "StringNotEquals"},
    {ConditionOperator::kStringEqualsIgnoreCase, "StringEqualsIgnoreCase"},
    {ConditionOperator::kStringNotEqualsIgnoreCase,
     "StringNotEqualsIgnoreCase"},
    {ConditionOperator::kStringLike, "StringLike"},
    {ConditionOperator::kStringNotLike, "StringNotLike"},
    {ConditionOperator::kNumericEquals, "NumericEquals"},
    {ConditionOperator::kNumericNotEquals, "NumericNotEquals"},
    {ConditionOperator::kNumericLessThan, "NumericLessThan"},
    {ConditionOperator::kNumericLessThanEquals, "NumericLessThanEquals"},
    {ConditionOperator::kNumericGreaterThan, "NumericGreaterThan"},
    {ConditionOperator::kNumericGreaterThanEquals,
     "NumericGreaterThanEquals"},
    {ConditionOperator::kDateEquals, "DateEquals"},
    {ConditionOperator::kDateNotEquals, "DateNotEquals"},
    {ConditionOperator::kDateLessThan, "DateLessThan"},
    {ConditionOperator::kDateLessThanEquals, "DateLessThanEquals"},
    {ConditionOperator::kDateGreaterThan, "DateGreaterThan"},
    {ConditionOperator::kDateGreaterThanEquals, "DateGreaterThanEquals"},
    {ConditionOperator::kBool, "Bool"},
    {ConditionOperator::kIpAddress, "IPAddress"},
    {ConditionOperator::kNotIpAddress, "NotIPAddress"},
};

template <typename T>
bool Satisfies(Relation relation, const T& lhs, const T& rhs) {
  switch (relation) {
    case Relation::kEquals:
      return lhs == rhs;
    case Relation::kNotEquals:
      return lhs != rhs;
    case Relation::kLessThan:
      return lhs < rhs;
    case Relation::kLessThanEquals:
      return lhs <= rhs;
    case Relation::kGreaterThan:
      return lhs > rhs;
    case Relation::kGreaterThanEquals:
      return lhs >= rhs;
  }
  return false;
}

// Optional '-' followed by decimal digits. SimpleAtoi alone would also take
// surrounding whitespace and a leading '+'.
std::optional<int64_t> ParseInteger(absl::string_view text) {
  absl::string_view digits = text;
  absl::ConsumePrefix(&digits, "-");
  if (digits.empty() || !absl::c_all_of(digits, absl::ascii_isdigit)) {
    return std::nullopt;
  }
  int64_t value;
  if (!absl::SimpleAtoi(text, &value)) return std::nullopt;
  return value;
}

std::optional<absl::Time> ParseTimestamp(absl::string_view text) {
  absl::Time time;
  std::string error;
  if (!absl::ParseTime(absl::RFC3339_full, text, &time, &error)) {
    return std::nullopt;
  }
  return time;
}

std::optional<bool> ParseBool(const AttributeValue& value) {
  if (value.type() == AttributeValue::Type::kBoolean) return value.boolean();
  bool result;
  if (!absl::SimpleAtob(value.text(), &result)) return std::nullopt;
  return result;
}

}  // namespace

std::optional<ConditionOperator> ParseConditionOperator(
    absl::string_view name) {
  for (const OperatorName& entry : kOperatorNames) {
    if (entry.name == name) return entry.op;
  }
  return std::nullopt;
}

absl::string_view ConditionOperatorName(ConditionOperator op) {
  for (const OperatorName& entry : kOperatorNames) {
    if (entry.op == op) return entry.name;
  }
  return "";
}

//
// Comparators
//

bool StringComparator::operator()(
    const AttributeValue& value, absl::Span<const std::string> accepted) const {
  const std::string& text = value.text();
  return absl::c_any_of(accepted, [&](const std::string& candidate) {
    bool result = false;
    switch (kind) {
      case Kind::kEquals:
        result = text == candidate;
        break;
      case Kind::kEqualsIgnoreCase:
        result = absl::EqualsIgnoreCase(text, candidate);
        break;
      case Kind::kContains:
        result = absl::StrContains(text, candidate);
        break;
    }
    return result != negate;
  });
}

bool IntegerComparator::operator()(
    const AttributeValue& value, absl::Span<const std::string> accepted) const {
  if (value.type() == AttributeValue::Type::kBoolean) return false;
  std::optional<int64_t> lhs = ParseInteger(value.text());
  if (!lhs.has_value()) return false;
  return absl::c_any_of(accepted, [&](const std::string& candidate) {
    std::optional<int64_t> rhs = ParseInteger(candidate);
    return rhs.has_value() && Satisfies(relation, *lhs, *rhs);
  });
}

bool TimestampComparator::operator()(
    const AttributeValue& value, absl::Span<const std::string> accepted) const {
  std::optional<absl::Time> lhs = ParseTimestamp(value.text());
  return absl::c_any_of(accepted, [&](const std::string& candidate) {
    std::optional<absl::Time> rhs = ParseTimestamp(candidate);
    if (!lhs.has_value() || !rhs.has_value()) {
      return relation == Relation::kNotEquals;
    }
    return Satisfies(relation, *lhs, *rhs);
  });
}

bool BoolComparator::operator()(const AttributeValue& value,
                                absl::Span<const std::string> accepted) const {
  std::optional<bool> lhs = ParseBool(value);
  if (!lhs.has_value()) return false;
  return absl::c_any_of(accepted, [&](const std::string& candidate) {
    bool rhs;
    return absl::SimpleAtob(candidate, &rhs) && rhs == *lhs;
  });
}

bool IpComparator::operator()(const AttributeValue& value,
                              absl::Span<const std::string> accepted) const {
  std::optional<IpAddress> request_ip = IpAddress::Parse(value.text());
  if (!request_ip.has_value()) return false;
  return absl::c_any_of(accepted, [&](const std::string& candidate) {
    std::optional<IpAddress> policy_ip = IpAddress::Parse(candidate);
    if (policy_ip.has_value()) return (*request_ip == *policy_ip) != negate;
    auto range = CidrRange::Parse(candidate);
    if (!range.ok()) {
      AUTHZ_TRACE_VLOG(condition_eval, 2)
          << "ignoring policy address \"" << candidate
          << "\": " << range.status().message();
      return false;
    }
    const bool contained = range->Contains(*request_ip);
    AUTHZ_TRACE_VLOG(condition_eval, 2)
        << request_ip->ToString() << (contained ? " in " : " not in ")
        << range->ToString();
    return contained != negate;
  });
}

//
// ConditionComparator
//

ConditionComparator::ConditionComparator(ConditionOperator op)
    : op_(op), comparator_(ComparatorFor(op)) {}

bool ConditionComparator::Matches(
    const AttributeValue& value, absl::Span<const std::string> accepted) const {
  return std::visit(
      [&](const auto& comparator) { return comparator(value, accepted); },
      comparator_);
}

ConditionComparator::Comparator ConditionComparator::ComparatorFor(
    ConditionOperator op) {
  using Kind = StringComparator::Kind;
  switch (op) {
    case ConditionOperator::kStringEquals:
      return StringComparator{Kind::kEquals, false};
    case ConditionOperator::kStringNotEquals:
      return StringComparator{Kind::kEquals, true};
    case ConditionOperator::kStringEqualsIgnoreCase:
      return StringComparator{Kind::kEqualsIgnoreCase, false};
    case ConditionOperator::kStringNotEqualsIgnoreCase:
      return StringComparator{Kind::kEqualsIgnoreCase, true};
    case ConditionOperator::kStringLike:
      return StringComparator{Kind::kContains, false};
    case ConditionOperator::kStringNotLike:
      return StringComparator{Kind::kContains, true};
    case ConditionOperator::kNumericEquals:
      return IntegerComparator{Relation::kEquals};
    case ConditionOperator::kNumericNotEquals:
      return IntegerComparator{Relation::kNotEquals};
    case ConditionOperator::kNumericLessThan:
      return IntegerComparator{Relation::kLessThan};
    case ConditionOperator::kNumericLessThanEquals:
      return IntegerComparator{Relation::kLessThanEquals};
    case ConditionOperator::kNumericGreaterThan:
      return IntegerComparator{Relation::kGreaterThan};
    case ConditionOperator::kNumericGreaterThanEquals:
      return IntegerComparator{Relation::kGreaterThanEquals};
    case ConditionOperator::kDateEquals:
      return TimestampComparator{Relation::kEquals};
    case ConditionOperator::kDateNotEquals:
      return TimestampComparator{Relation::kNotEquals};
    case ConditionOperator::kDateLessThan:
      return TimestampComparator{Relation::kLessThan};
    case ConditionOperator::kDateLessThanEquals:
      return TimestampComparator{Relation::kLessThanEquals};
    case ConditionOperator::kDateGreaterThan:
      return TimestampComparator{Relation::kGreaterThan};
    case ConditionOperator::kDateGreaterThanEquals:
      return TimestampComparator{Relation::kGreaterThanEquals};
    case ConditionOperator::kBool:
      return BoolComparator{};
    case ConditionOperator::kIpAddress:
      return IpComparator{false};
    case ConditionOperator::kNotIpAddress:
      return IpComparator{true};
  }
  // Unreachable for valid enum values; fail closed.
  return StringComparator{Kind::kEquals, false};
}

}  // namespace authz_core
