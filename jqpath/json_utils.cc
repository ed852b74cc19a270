// Copyright 2018 The JqPath Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "jqpath/json_utils.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include <glog/logging.h>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "json/json.h"
#include "jqpath/platform/str_util.h"

namespace jq_path {
namespace json_utils {

namespace {

// Documents nested deeper than this are rejected instead of risking the
// stack.
constexpr int kMaxParseDepth = 2048;

bool IsJsonWhitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

string FormatDouble(double value) {
  if (std::isnan(value)) return "null";
  if (std::isinf(value)) {
    return value > 0 ? "1.7976931348623157e+308" : "-1.7976931348623157e+308";
  }
  string result;
  for (int precision = 1; precision <= 17; ++precision) {
    result = absl::StrFormat("%.*g", precision, value);
    double round_trip = 0;
    if (absl::SimpleAtod(result, &round_trip) && round_trip == value) {
      break;
    }
  }
  return result;
}

void AppendIndent(const WriteOptions& options, int depth, string* out) {
  out->push_back('\n');
  if (options.use_tab) {
    out->append(depth, '\t');
  } else {
    out->append(static_cast<size_t>(depth) * options.indent, ' ');
  }
}

void AppendQuoted(absl::string_view str, string* out) {
  out->push_back('"');
  strings::JsonEscape(str, out);
  out->push_back('"');
}

void AppendJson(const Value& value, const WriteOptions& options, int depth,
                string* out) {
  const bool pretty = options.use_tab || options.indent > 0;
  switch (value.type()) {
    case Value::kNull:
      out->append("null");
      return;
    case Value::kBoolean:
      out->append(value.AsBool() ? "true" : "false");
      return;
    case Value::kNumber:
      out->append(FormatNumber(value));
      return;
    case Value::kString:
      AppendQuoted(value.AsString(), out);
      return;
    case Value::kArray: {
      const Array& array = value.AsArray();
      if (array.empty()) {
        out->append("[]");
        return;
      }
      out->push_back('[');
      for (size_t i = 0; i < array.size(); ++i) {
        if (i > 0) out->push_back(',');
        if (pretty) AppendIndent(options, depth + 1, out);
        AppendJson(array[i], options, depth + 1, out);
      }
      if (pretty) AppendIndent(options, depth, out);
      out->push_back(']');
      return;
    }
    case Value::kObject: {
      const Object& object = value.AsObject();
      if (object.empty()) {
        out->append("{}");
        return;
      }
      std::vector<const Object::Member*> members;
      members.reserve(object.size());
      for (const auto& member : object) {
        members.push_back(&member);
      }
      if (options.sort_keys) {
        std::sort(members.begin(), members.end(),
                  [](const Object::Member* a, const Object::Member* b) {
                    return a->first < b->first;
                  });
      }
      out->push_back('{');
      for (size_t i = 0; i < members.size(); ++i) {
        if (i > 0) out->push_back(',');
        if (pretty) AppendIndent(options, depth + 1, out);
        AppendQuoted(members[i]->first, out);
        out->append(pretty ? ": " : ":");
        AppendJson(members[i]->second, options, depth + 1, out);
      }
      if (pretty) AppendIndent(options, depth, out);
      out->push_back('}');
      return;
    }
  }
}

}  // namespace

string WriteJson(const Value& value, const WriteOptions& options) {
  string out;
  AppendJson(value, options, 0, &out);
  return out;
}

string WriteCompactJson(const Value& value) {
  WriteOptions options;
  options.indent = 0;
  return WriteJson(value, options);
}

string FormatNumber(const Value& number) {
  switch (number.number_kind()) {
    case Value::kInt64:
      return absl::StrCat(number.AsInt64());
    case Value::kUInt64:
      return absl::StrCat(number.AsUInt64());
    case Value::kDouble:
      return FormatDouble(number.AsDouble());
  }
  return "null";
}

bool ParseJson(absl::string_view text, Value* value, string* error) {
  JsonDocumentReader reader(text);
  Value result;
  if (!reader.Next(&result)) {
    if (error != nullptr) {
      *error = reader.ok() ? "Expected a JSON document" : reader.error();
    }
    return false;
  }
  Value extra;
  if (reader.Next(&extra) || !reader.ok()) {
    if (error != nullptr) {
      *error = reader.ok() ? "Unexpected data after the JSON document"
                           : reader.error();
    }
    return false;
  }
  value->Swap(&result);
  return true;
}

//------------------------------------------------------------------------------

JsonDocumentReader::JsonDocumentReader(absl::string_view text) : text_(text) {}

bool JsonDocumentReader::Next(Value* value) {
  if (!ok()) return false;
  SkipWhitespace();
  if (pos_ >= text_.size()) return false;
  Value result;
  if (!ParseValue(0, &result)) return false;
  // Documents must be separated by whitespace unless they are self
  // delimiting (strings, arrays, objects).
  if (pos_ < text_.size() && !IsJsonWhitespace(text_[pos_]) &&
      (result.IsNumber() || result.IsBoolean() || result.IsNull()) &&
      text_[pos_] != '[' && text_[pos_] != '{' && text_[pos_] != '"') {
    return Fail(absl::StrCat("Unexpected character '", string(1, text_[pos_]),
                             "'"));
  }
  ++documents_read_;
  value->Swap(&result);
  return true;
}

void JsonDocumentReader::SkipWhitespace() {
  while (pos_ < text_.size() && IsJsonWhitespace(text_[pos_])) ++pos_;
}

bool JsonDocumentReader::Fail(const string& message) {
  int line = 1;
  int column = 1;
  for (size_t i = 0; i < pos_ && i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      ++line;
      column = 1;
    } else {
      ++column;
    }
  }
  error_ = absl::StrCat(message, " at line ", line, ", column ", column);
  VLOG(1) << "JSON parse error: " << error_;
  return false;
}

bool JsonDocumentReader::ParseValue(int depth, Value* value) {
  if (depth > kMaxParseDepth) {
    return Fail("Exceeds depth limit for parsing");
  }
  SkipWhitespace();
  if (pos_ >= text_.size()) return Fail("Unfinished JSON term");
  const char c = text_[pos_];
  switch (c) {
    case 'n':
      if (!ParseLiteral("null")) return false;
      *value = Value();
      return true;
    case 't':
      if (!ParseLiteral("true")) return false;
      *value = Value(true);
      return true;
    case 'f':
      if (!ParseLiteral("false")) return false;
      *value = Value(false);
      return true;
    case '"': {
      string str;
      if (!ParseString(&str)) return false;
      *value = Value(std::move(str));
      return true;
    }
    case '[': {
      ++pos_;
      Array array;
      SkipWhitespace();
      if (pos_ < text_.size() && text_[pos_] == ']') {
        ++pos_;
        *value = Value(std::move(array));
        return true;
      }
      while (true) {
        Value element;
        if (!ParseValue(depth + 1, &element)) return false;
        array.push_back(std::move(element));
        SkipWhitespace();
        if (pos_ >= text_.size()) return Fail("Unfinished JSON term");
        if (text_[pos_] == ',') {
          ++pos_;
          continue;
        }
        if (text_[pos_] == ']') {
          ++pos_;
          break;
        }
        return Fail("Expected separator between values");
      }
      *value = Value(std::move(array));
      return true;
    }
    case '{': {
      ++pos_;
      Object object;
      SkipWhitespace();
      if (pos_ < text_.size() && text_[pos_] == '}') {
        ++pos_;
        *value = Value(std::move(object));
        return true;
      }
      while (true) {
        SkipWhitespace();
        if (pos_ >= text_.size()) return Fail("Unfinished JSON term");
        if (text_[pos_] != '"') return Fail("Object keys must be strings");
        string key;
        if (!ParseString(&key)) return false;
        SkipWhitespace();
        if (pos_ >= text_.size() || text_[pos_] != ':') {
          return Fail("Objects must consist of key:value pairs");
        }
        ++pos_;
        Value member;
        if (!ParseValue(depth + 1, &member)) return false;
        object.Set(key, std::move(member));
        SkipWhitespace();
        if (pos_ >= text_.size()) return Fail("Unfinished JSON term");
        if (text_[pos_] == ',') {
          ++pos_;
          continue;
        }
        if (text_[pos_] == '}') {
          ++pos_;
          break;
        }
        return Fail("Expected separator between values");
      }
      *value = Value(std::move(object));
      return true;
    }
    default:
      if (c == '-' || IsDigit(c)) return ParseNumber(value);
      return Fail(absl::StrCat("Unexpected character '", string(1, c), "'"));
  }
}

bool JsonDocumentReader::ParseLiteral(absl::string_view literal) {
  if (text_.substr(pos_, literal.size()) != literal) {
    return Fail("Invalid literal");
  }
  pos_ += literal.size();
  return true;
}

bool JsonDocumentReader::ParseString(string* value) {
  // Skip the opening quote.
  const size_t start = ++pos_;
  bool escaped = false;
  while (pos_ < text_.size()) {
    const char c = text_[pos_];
    if (escaped) {
      escaped = false;
    } else if (c == '\\') {
      escaped = true;
    } else if (c == '"') {
      break;
    } else if (static_cast<unsigned char>(c) < 0x20) {
      return Fail("Invalid control character in string");
    }
    ++pos_;
  }
  if (pos_ >= text_.size()) return Fail("Unfinished string");
  size_t error_offset = 0;
  if (!strings::JsonUnescape(text_.substr(start, pos_ - start), value,
                             &error_offset)) {
    pos_ = start + error_offset;
    return Fail("Invalid escape");
  }
  // Skip the closing quote.
  ++pos_;
  return true;
}

bool JsonDocumentReader::ParseNumber(Value* value) {
  const size_t start = pos_;
  if (text_[pos_] == '-') ++pos_;
  if (pos_ >= text_.size() || !IsDigit(text_[pos_])) {
    return Fail("Invalid numeric literal");
  }
  if (text_[pos_] == '0') {
    ++pos_;
  } else {
    while (pos_ < text_.size() && IsDigit(text_[pos_])) ++pos_;
  }
  bool integral = true;
  if (pos_ < text_.size() && text_[pos_] == '.') {
    integral = false;
    ++pos_;
    if (pos_ >= text_.size() || !IsDigit(text_[pos_])) {
      return Fail("Invalid numeric literal");
    }
    while (pos_ < text_.size() && IsDigit(text_[pos_])) ++pos_;
  }
  if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
    integral = false;
    ++pos_;
    if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) {
      ++pos_;
    }
    if (pos_ >= text_.size() || !IsDigit(text_[pos_])) {
      return Fail("Invalid numeric literal");
    }
    while (pos_ < text_.size() && IsDigit(text_[pos_])) ++pos_;
  }
  const absl::string_view literal = text_.substr(start, pos_ - start);
  if (integral) {
    int64 signed_value = 0;
    if (absl::SimpleAtoi(literal, &signed_value)) {
      *value = Value(signed_value);
      return true;
    }
    uint64 unsigned_value = 0;
    if (literal[0] != '-' && absl::SimpleAtoi(literal, &unsigned_value)) {
      *value = Value(unsigned_value);
      return true;
    }
  }
  double double_value = 0;
  if (!absl::SimpleAtod(literal, &double_value)) {
    pos_ = start;
    return Fail("Invalid numeric literal");
  }
  *value = Value(double_value);
  return true;
}

//------------------------------------------------------------------------------

Json::Value ToJsonCpp(const Value& value) {
  switch (value.type()) {
    case Value::kNull:
      return Json::Value(Json::nullValue);
    case Value::kBoolean:
      return Json::Value(value.AsBool());
    case Value::kNumber:
      switch (value.number_kind()) {
        case Value::kInt64:
          return Json::Value(static_cast<Json::Int64>(value.AsInt64()));
        case Value::kUInt64:
          return Json::Value(static_cast<Json::UInt64>(value.AsUInt64()));
        case Value::kDouble:
          return Json::Value(value.AsDouble());
      }
      break;
    case Value::kString:
      return Json::Value(value.AsString());
    case Value::kArray: {
      Json::Value result(Json::arrayValue);
      for (const Value& element : value.AsArray()) {
        result.append(ToJsonCpp(element));
      }
      return result;
    }
    case Value::kObject: {
      Json::Value result(Json::objectValue);
      for (const auto& member : value.AsObject()) {
        result[member.first] = ToJsonCpp(member.second);
      }
      return result;
    }
  }
  return Json::Value(Json::nullValue);
}

Value FromJsonCpp(const Json::Value& value) {
  switch (value.type()) {
    case Json::nullValue:
      return Value();
    case Json::intValue:
      return Value(static_cast<int64>(value.asInt64()));
    case Json::uintValue:
      return Value(static_cast<uint64>(value.asUInt64()));
    case Json::realValue:
      return Value(value.asDouble());
    case Json::stringValue:
      return Value(value.asString());
    case Json::booleanValue:
      return Value(value.asBool());
    case Json::arrayValue: {
      Array array;
      array.reserve(value.size());
      for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
        array.push_back(FromJsonCpp(value[i]));
      }
      return Value(std::move(array));
    }
    case Json::objectValue: {
      Object object;
      for (const string& name : value.getMemberNames()) {
        object.Set(name, FromJsonCpp(value[name]));
      }
      return Value(std::move(object));
    }
  }
  return Value();
}

}  // namespace json_utils
}  // namespace jq_path
