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

#include "src/core/util/json/json_writer.h"

#include <stddef.h>
#include <stdint.h>

#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"

namespace authz_core {

namespace {

// The idea of the writer is basically symmetrical of the reader. While the
// reader emits various calls to your code, the writer takes basically the
// same calls and emit json out of it.
class JsonWriter {
 public:
  static std::string Dump(const Json& value, int indent);

 private:
  explicit JsonWriter(int indent) : indent_(indent) {}

  void OutputIndent();
  void ValueEnd();
  void EscapeUtf16(uint16_t utf16);
  void EscapeString(absl::string_view string);
  void ContainerBegins(char open);
  void ContainerEnds(char close);
  void ObjectKey(absl::string_view string);
  void DumpValue(const Json& value);

  int indent_;
  int depth_ = 0;
  bool container_empty_ = true;
  bool got_key_ = false;
  std::string output_;
};

void JsonWriter::OutputIndent() {
  if (indent_ == 0) return;
  if (got_key_) {
    output_.push_back(' ');
    return;
  }
  output_.append(static_cast<size_t>(depth_) * indent_, ' ');
}

void JsonWriter::ValueEnd() {
  if (container_empty_) {
    container_empty_ = false;
    if (indent_ == 0 || depth_ == 0) return;
    output_.push_back('\n');
  } else {
    output_.push_back(',');
    if (indent_ == 0) return;
    output_.push_back('\n');
  }
}

void JsonWriter::EscapeUtf16(uint16_t utf16) {
  absl::StrAppendFormat(&output_, "\\u%04x", utf16);
}

void JsonWriter::EscapeString(absl::string_view string) {
  output_.push_back('"');
  for (size_t idx = 0; idx < string.size(); ++idx) {
    uint8_t c = static_cast<uint8_t>(string[idx]);
    if (c >= 32 && c <= 126) {
      if (c == '\\' || c == '"') output_.push_back('\\');
      output_.push_back(static_cast<char>(c));
    } else if (c < 32 || c == 127) {
      switch (c) {
        case '\b':
          output_.append("\\b");
          break;
        case '\f':
          output_.append("\\f");
          break;
        case '\n':
          output_.append("\\n");
          break;
        case '\r':
          output_.append("\\r");
          break;
        case '\t':
          output_.append("\\t");
          break;
        default:
          EscapeUtf16(c);
          break;
      }
    } else {
      // Multi-byte UTF-8.  The reader only produces valid sequences; any
      // stray byte is written as its Latin-1 code point.
      uint32_t utf32 = 0;
      int extra = 0;
      if ((c & 0xe0) == 0xc0) {
        utf32 = c & 0x1f;
        extra = 1;
      } else if ((c & 0xf0) == 0xe0) {
        utf32 = c & 0x0f;
        extra = 2;
      } else if ((c & 0xf8) == 0xf0) {
        utf32 = c & 0x07;
        extra = 3;
      }
      bool valid = extra > 0 && idx + extra < string.size();
      for (int i = 1; valid && i <= extra; ++i) {
        uint8_t next = static_cast<uint8_t>(string[idx + i]);
        if ((next & 0xc0) != 0x80) {
          valid = false;
          break;
        }
        utf32 = (utf32 << 6) | (next & 0x3f);
      }
      if (!valid) {
        EscapeUtf16(c);
        continue;
      }
      idx += extra;
      if (utf32 >= 0x10000) {
        // To properly encode a utf-16 surrogate pair, the code point is
        // first reduced by 0x10000, then split into two 10-bit halves.
        utf32 -= 0x10000;
        EscapeUtf16(static_cast<uint16_t>(0xd800 | (utf32 >> 10)));
        EscapeUtf16(static_cast<uint16_t>(0xdc00 | (utf32 & 0x3ff)));
      } else {
        EscapeUtf16(static_cast<uint16_t>(utf32));
      }
    }
  }
  output_.push_back('"');
}

void JsonWriter::ContainerBegins(char open) {
  if (!got_key_) ValueEnd();
  OutputIndent();
  output_.push_back(open);
  container_empty_ = true;
  got_key_ = false;
  ++depth_;
}

void JsonWriter::ContainerEnds(char close) {
  if (indent_ != 0 && !container_empty_) output_.push_back('\n');
  --depth_;
  if (!container_empty_) OutputIndent();
  output_.push_back(close);
  container_empty_ = false;
  got_key_ = false;
}

void JsonWriter::ObjectKey(absl::string_view string) {
  ValueEnd();
  OutputIndent();
  EscapeString(string);
  output_.push_back(':');
  got_key_ = true;
}

void JsonWriter::DumpValue(const Json& value) {
  switch (value.type()) {
    case Json::Type::kObject:
      ContainerBegins('{');
      for (const auto& p : value.object()) {
        ObjectKey(p.first);
        DumpValue(p.second);
      }
      ContainerEnds('}');
      return;
    case Json::Type::kArray:
      ContainerBegins('[');
      for (const auto& v : value.array()) {
        DumpValue(v);
      }
      ContainerEnds(']');
      return;
    default:
      break;
  }
  if (!got_key_) ValueEnd();
  OutputIndent();
  got_key_ = false;
  switch (value.type()) {
    case Json::Type::kString:
      EscapeString(value.string());
      break;
    case Json::Type::kNumber:
      output_.append(value.string());
      break;
    case Json::Type::kBoolean:
      output_.append(value.boolean() ? "true" : "false");
      break;
    case Json::Type::kNull:
      output_.append("null");
      break;
    default:
      break;
  }
}

std::string JsonWriter::Dump(const Json& value, int indent) {
  JsonWriter writer(indent);
  writer.DumpValue(value);
  return std::move(writer.output_);
}

}  // namespace

std::string JsonDump(const Json& json, int indent) {
  return JsonWriter::Dump(json, indent);
}

}  // namespace authz_core
