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

#include "src/core/security/authorization/attribute_value.h"

#include "absl/strings/str_cat.h"

namespace authz_core {

AttributeValue AttributeValue::FromNumber(int64_t value) {
  return AttributeValue(Type::kNumber, absl::StrCat(value));
}

std::optional<AttributeValue> AttributeValue::FromJson(const Json& json) {
  switch (json.type()) {
    case Json::Type::kString:
      return FromString(json.string());
    case Json::Type::kNumber:
      return AttributeValue(Type::kNumber, json.string());
    case Json::Type::kBoolean:
      return FromBool(json.boolean());
    default:
      return std::nullopt;
  }
}

Json AttributeValue::ToJson() const {
  switch (type_) {
    case Type::kString:
      return Json::FromString(text_);
    case Type::kNumber:
      return Json::FromNumber(text_);
    case Type::kBoolean:
      return Json::FromBool(boolean());
  }
  return Json();
}

}  // namespace authz_core
