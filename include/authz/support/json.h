//
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
//

#ifndef AUTHZ_SUPPORT_JSON_H
#define AUTHZ_SUPPORT_JSON_H

#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "absl/strings/str_cat.h"

namespace authz_core {

// Parsed JSON document. Condition and context documents are decoded into this
// type before they are interpreted, so the accessors below are shaped around
// "is this an X, and if so give it to me" lookups.
class Json {
 public:
  // Alternative index of the underlying variant.
  enum class Type {
    kNull,
    kBoolean,
    kNumber,  // Kept as the literal text from the document.
    kString,
    kObject,
    kArray,
  };

  template <typename Sink>
  friend void AbslStringify(Sink& sink, Type type) {
    switch (type) {
      case Type::kNull:
        sink.Append("null");
        return;
      case Type::kBoolean:
        sink.Append("boolean");
        return;
      case Type::kNumber:
        sink.Append("number");
        return;
      case Type::kString:
        sink.Append("string");
        return;
      case Type::kObject:
        sink.Append("object");
        return;
      case Type::kArray:
        sink.Append("array");
        return;
    }
  }

  using Object = std::map<std::string, Json>;
  using Array = std::vector<Json>;

  static Json FromBool(bool b) { return Json(std::in_place_type<bool>, b); }
  static Json FromNumber(std::string text) {
    return Json(std::in_place_type<NumberText>, std::move(text));
  }
  template <typename T,
            typename = std::enable_if_t<std::is_arithmetic_v<T> &&
                                        !std::is_same_v<T, bool>>>
  static Json FromNumber(T value) {
    return FromNumber(absl::StrCat(value));
  }
  static Json FromString(std::string str) {
    return Json(std::in_place_type<std::string>, std::move(str));
  }
  static Json FromObject(Object object) {
    return Json(std::in_place_type<Object>, std::move(object));
  }
  static Json FromArray(Array array) {
    return Json(std::in_place_type<Array>, std::move(array));
  }

  Json() = default;

  Type type() const { return static_cast<Type>(value_.index()); }
  bool is_null() const { return type() == Type::kNull; }

  // Typed views. Each returns nullptr when the value holds another type.
  const Object* as_object() const { return std::get_if<Object>(&value_); }
  const Array* as_array() const { return std::get_if<Array>(&value_); }
  const std::string* as_string() const {
    return std::get_if<std::string>(&value_);
  }

  // Unchecked payload accessors; the caller has already looked at type().
  bool boolean() const { return std::get<bool>(value_); }
  // Valid for kString and kNumber.
  const std::string& string() const {
    if (const NumberText* n = std::get_if<NumberText>(&value_)) return n->text;
    return std::get<std::string>(value_);
  }
  const Object& object() const { return std::get<Object>(value_); }
  const Array& array() const { return std::get<Array>(value_); }

  bool operator==(const Json& other) const { return value_ == other.value_; }
  bool operator!=(const Json& other) const { return !(*this == other); }

 private:
  struct NumberText {
    explicit NumberText(std::string t) : text(std::move(t)) {}
    std::string text;
    bool operator==(const NumberText& other) const {
      return text == other.text;
    }
  };
  // Order must match Type.
  using Value = std::variant<std::monostate, bool, NumberText, std::string,
                             Object, Array>;

  template <typename T, typename Arg>
  Json(std::in_place_type_t<T> tag, Arg&& arg)
      : value_(tag, std::forward<Arg>(arg)) {}

  Value value_;
};

}  // namespace authz_core

#endif  // AUTHZ_SUPPORT_JSON_H
