//
// Copyright 2015-2016 gRPC authors.
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

#include "src/core/util/json/json_reader.h"

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

namespace authz_core {

namespace {

// A strict implementation of RFC 8259.  Parsing stops at the first error.
class JsonReader {
 public:
  static absl::StatusOr<Json> Parse(absl::string_view input);

 private:
  static constexpr size_t kMaxNestingDepth = 64;

  explicit JsonReader(absl::string_view input) : input_(input) {}

  bool ParseValue(size_t depth, Json* out);
  bool ParseObject(size_t depth, Json* out);
  bool ParseArray(size_t depth, Json* out);
  bool ParseString(std::string* out);
  bool ParseEscape(std::string* out);
  bool ParseHex4(uint32_t* out);
  bool ParseUtf8Sequence(std::string* out);
  bool ParseNumber(Json* out);
  bool ParseLiteral(absl::string_view literal);
  bool ConsumeDigits();

  void SkipWhitespace();
  bool AtEnd() const { return pos_ >= input_.size(); }
  char Peek() const { return input_[pos_]; }
  bool Consume(char c) {
    if (AtEnd() || Peek() != c) return false;
    ++pos_;
    return true;
  }

  bool Error(absl::string_view message) {
    error_ = absl::StrCat("error at index ", pos_, ": ", message);
    return false;
  }

  absl::string_view input_;
  size_t pos_ = 0;
  std::string error_;
};

void AppendUtf8(uint32_t code_point, std::string* out) {
  if (code_point < 0x80) {
    out->push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out->push_back(static_cast<char>(0xc0 | (code_point >> 6)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3f)));
  } else if (code_point < 0x10000) {
    out->push_back(static_cast<char>(0xe0 | (code_point >> 12)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3f)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3f)));
  } else {
    out->push_back(static_cast<char>(0xf0 | (code_point >> 18)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3f)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3f)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3f)));
  }
}

absl::StatusOr<Json> JsonReader::Parse(absl::string_view input) {
  JsonReader reader(input);
  Json value;
  bool ok = false;
  reader.SkipWhitespace();
  if (reader.AtEnd()) {
    reader.Error("empty input");
  } else if (reader.ParseValue(0, &value)) {
    reader.SkipWhitespace();
    ok = reader.AtEnd() || reader.Error("trailing garbage after value");
  }
  if (!ok) {
    return absl::InvalidArgumentError(
        absl::StrCat("JSON parsing failed: [", reader.error_, "]"));
  }
  return std::move(value);
}

void JsonReader::SkipWhitespace() {
  while (!AtEnd()) {
    char c = Peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') return;
    ++pos_;
  }
}

bool JsonReader::ParseValue(size_t depth, Json* out) {
  if (AtEnd()) return Error("unexpected end of input");
  switch (Peek()) {
    case '{':
      return ParseObject(depth, out);
    case '[':
      return ParseArray(depth, out);
    case '"': {
      std::string str;
      if (!ParseString(&str)) return false;
      *out = Json::FromString(std::move(str));
      return true;
    }
    case 't':
      if (!ParseLiteral("true")) return false;
      *out = Json::FromBool(true);
      return true;
    case 'f':
      if (!ParseLiteral("false")) return false;
      *out = Json::FromBool(false);
      return true;
    case 'n':
      if (!ParseLiteral("null")) return false;
      *out = Json();
      return true;
    default:
      if (Peek() == '-' || absl::ascii_isdigit(Peek())) {
        return ParseNumber(out);
      }
      return Error(absl::StrFormat("unexpected character '%c'", Peek()));
  }
}

bool JsonReader::ParseObject(size_t depth, Json* out) {
  if (depth >= kMaxNestingDepth) return Error("exceeded max nesting depth");
  ++pos_;  // '{'
  Json::Object object;
  SkipWhitespace();
  if (Consume('}')) {
    *out = Json::FromObject(std::move(object));
    return true;
  }
  while (true) {
    SkipWhitespace();
    if (AtEnd() || Peek() != '"') return Error("expected object key");
    std::string key;
    if (!ParseString(&key)) return false;
    SkipWhitespace();
    if (!Consume(':')) return Error("expected ':' after object key");
    SkipWhitespace();
    Json value;
    if (!ParseValue(depth + 1, &value)) return false;
    if (!object.emplace(key, std::move(value)).second) {
      return Error(absl::StrCat("duplicate key \"", key, "\""));
    }
    SkipWhitespace();
    if (Consume(',')) continue;
    if (Consume('}')) break;
    return Error("expected ',' or '}' in object");
  }
  *out = Json::FromObject(std::move(object));
  return true;
}

bool JsonReader::ParseArray(size_t depth, Json* out) {
  if (depth >= kMaxNestingDepth) return Error("exceeded max nesting depth");
  ++pos_;  // '['
  Json::Array array;
  SkipWhitespace();
  if (Consume(']')) {
    *out = Json::FromArray(std::move(array));
    return true;
  }
  while (true) {
    SkipWhitespace();
    Json value;
    if (!ParseValue(depth + 1, &value)) return false;
    array.emplace_back(std::move(value));
    SkipWhitespace();
    if (Consume(',')) continue;
    if (Consume(']')) break;
    return Error("expected ',' or ']' in array");
  }
  *out = Json::FromArray(std::move(array));
  return true;
}

bool JsonReader::ParseString(std::string* out) {
  ++pos_;  // '"'
  while (true) {
    if (AtEnd()) return Error("unterminated string");
    unsigned char c = static_cast<unsigned char>(Peek());
    if (c == '"') {
      ++pos_;
      return true;
    }
    if (c == '\\') {
      if (!ParseEscape(out)) return false;
    } else if (c < 0x20) {
      return Error("illegal control character in string");
    } else if (c < 0x80) {
      out->push_back(static_cast<char>(c));
      ++pos_;
    } else if (!ParseUtf8Sequence(out)) {
      return false;
    }
  }
}

bool JsonReader::ParseEscape(std::string* out) {
  ++pos_;  // '\\'
  if (AtEnd()) return Error("unterminated escape sequence");
  char c = Peek();
  ++pos_;
  switch (c) {
    case '"':
    case '\\':
    case '/':
      out->push_back(c);
      return true;
    case 'b':
      out->push_back('\b');
      return true;
    case 'f':
      out->push_back('\f');
      return true;
    case 'n':
      out->push_back('\n');
      return true;
    case 'r':
      out->push_back('\r');
      return true;
    case 't':
      out->push_back('\t');
      return true;
    case 'u': {
      uint32_t code_point;
      if (!ParseHex4(&code_point)) return false;
      if (code_point >= 0xdc00 && code_point <= 0xdfff) {
        return Error("unpaired low surrogate");
      }
      if (code_point >= 0xd800 && code_point <= 0xdbff) {
        if (!Consume('\\') || !Consume('u')) {
          return Error("high surrogate not followed by low surrogate");
        }
        uint32_t low;
        if (!ParseHex4(&low)) return false;
        if (low < 0xdc00 || low > 0xdfff) {
          return Error("invalid low surrogate");
        }
        code_point = 0x10000 + ((code_point - 0xd800) << 10) + (low - 0xdc00);
      }
      AppendUtf8(code_point, out);
      return true;
    }
    default:
      --pos_;
      return Error(absl::StrFormat("invalid escape character '%c'", c));
  }
}

bool JsonReader::ParseHex4(uint32_t* out) {
  if (input_.size() - pos_ < 4) return Error("truncated \\u escape");
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    char c = input_[pos_];
    uint32_t digit;
    if (c >= '0' && c <= '9') {
      digit = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      digit = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      digit = c - 'A' + 10;
    } else {
      return Error("invalid hex digit in \\u escape");
    }
    value = (value << 4) | digit;
    ++pos_;
  }
  *out = value;
  return true;
}

bool JsonReader::ParseUtf8Sequence(std::string* out) {
  const unsigned char lead = static_cast<unsigned char>(Peek());
  size_t length;
  unsigned char second_min = 0x80;
  unsigned char second_max = 0xbf;
  if (lead >= 0xc2 && lead <= 0xdf) {
    length = 2;
  } else if (lead >= 0xe0 && lead <= 0xef) {
    length = 3;
    if (lead == 0xe0) second_min = 0xa0;  // overlong
    if (lead == 0xed) second_max = 0x9f;  // surrogates
  } else if (lead >= 0xf0 && lead <= 0xf4) {
    length = 4;
    if (lead == 0xf0) second_min = 0x90;  // overlong
    if (lead == 0xf4) second_max = 0x8f;  // above U+10FFFF
  } else {
    return Error("invalid UTF-8 lead byte");
  }
  if (input_.size() - pos_ < length) return Error("truncated UTF-8 sequence");
  for (size_t i = 1; i < length; ++i) {
    unsigned char c = static_cast<unsigned char>(input_[pos_ + i]);
    unsigned char min = i == 1 ? second_min : 0x80;
    unsigned char max = i == 1 ? second_max : 0xbf;
    if (c < min || c > max) return Error("invalid UTF-8 continuation byte");
  }
  out->append(input_.data() + pos_, length);
  pos_ += length;
  return true;
}

bool JsonReader::ConsumeDigits() {
  size_t start = pos_;
  while (!AtEnd() && absl::ascii_isdigit(Peek())) ++pos_;
  return pos_ > start;
}

bool JsonReader::ParseNumber(Json* out) {
  const size_t start = pos_;
  Consume('-');
  if (Consume('0')) {
    if (!AtEnd() && absl::ascii_isdigit(Peek())) {
      return Error("leading zero in number");
    }
  } else if (!ConsumeDigits()) {
    return Error("expected digit");
  }
  if (Consume('.') && !ConsumeDigits()) {
    return Error("expected digit after decimal point");
  }
  if (Consume('e') || Consume('E')) {
    if (!Consume('+')) Consume('-');
    if (!ConsumeDigits()) return Error("expected digit in exponent");
  }
  *out = Json::FromNumber(std::string(input_.substr(start, pos_ - start)));
  return true;
}

bool JsonReader::ParseLiteral(absl::string_view literal) {
  if (input_.substr(pos_, literal.size()) != literal) {
    return Error(absl::StrCat("invalid literal, expected ", literal));
  }
  pos_ += literal.size();
  return true;
}

}  // namespace

absl::StatusOr<Json> JsonParse(absl::string_view json_str) {
  return JsonReader::Parse(json_str);
}

}  // namespace authz_core
