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

#ifndef AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_ATTRIBUTE_VALUE_H
#define AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_ATTRIBUTE_VALUE_H

#include <authz/support/json.h>
#include <stdint.h>

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace authz_core {

// A single scalar fact about the current request, e.g. its source IP or the
// current time.  Never a collection.
class AttributeValue {
 public:
  enum class Type {
    kString,
    kNumber,   // Kept in JSON text form.
    kBoolean,
  };

  static AttributeValue FromString(std::string value) {
    return AttributeValue(Type::kString, std::move(value));
  }
  static AttributeValue FromNumber(int64_t value);
  static AttributeValue FromBool(bool value) {
    return AttributeValue(Type::kBoolean, value ? "true" : "false");
  }
  // Returns nullopt for null, object and array values.
  static std::optional<AttributeValue> FromJson(const Json& json);

  Type type() const { return type_; }
  // Strings verbatim, numbers as written in JSON, booleans as "true" or
  // "false".  This is what string operators compare against.
  const std::string& text() const { return text_; }
  // Only meaningful for kBoolean.
  bool boolean() const { return type_ == Type::kBoolean && text_ == "true"; }

  Json ToJson() const;

  bool operator==(const AttributeValue& other) const {
    return type_ == other.type_ && text_ == other.text_;
  }

 private:
  AttributeValue(Type type, std::string text)
      : type_(type), text_(std::move(text)) {}

  Type type_;
  std::string text_;
};

// Named attributes of the current request.
using ConditionContext = std::map<std::string, AttributeValue>;

}  // namespace authz_core

#endif  // AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_ATTRIBUTE_VALUE_H
