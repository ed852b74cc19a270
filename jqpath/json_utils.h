/*
 * Copyright 2018 The JqPath Authors.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Reading and writing JSON text, and conversion to and from jsoncpp values.

#ifndef JQ_PATH_JSON_UTILS_H_
#define JQ_PATH_JSON_UTILS_H_

#include <string>

#include "absl/strings/string_view.h"
#include "jqpath/platform/types.h"
#include "jqpath/value.h"

namespace Json { class Value; }

namespace jq_path {
namespace json_utils {

struct WriteOptions {
  // Spaces per nesting level. Zero produces single-line output with no
  // whitespace between tokens.
  int indent = 2;
  // Indent with one tab per level instead of spaces.
  bool use_tab = false;
  // Emit object members in byte-wise key order instead of insertion order.
  bool sort_keys = false;
};

// Renders 'value' as JSON text without a trailing newline.
string WriteJson(const Value& value, const WriteOptions& options);

// Same as WriteJson() with indent 0.
string WriteCompactJson(const Value& value);

// Renders a number the way jq does: integers exactly, doubles in the shortest
// representation that reads back to the same double, NaN as null and
// infinities as the largest finite double.
string FormatNumber(const Value& number);

// Parses exactly one JSON document; surrounding whitespace is allowed.
// Returns false and sets 'error' (if non-null) on malformed input.
bool ParseJson(absl::string_view text, Value* value, string* error);

// Reads a sequence of whitespace separated JSON documents from an in-memory
// buffer. The buffer must outlive the reader.
// Sample use:
//   JsonDocumentReader reader(text);
//   Value document;
//   while (reader.Next(&document)) { ... }
//   if (!reader.ok()) LOG(ERROR) << reader.error();
class JsonDocumentReader {
 public:
  explicit JsonDocumentReader(absl::string_view text);
  JsonDocumentReader(const JsonDocumentReader&) = delete;
  JsonDocumentReader& operator=(const JsonDocumentReader&) = delete;

  // Parses the next document into 'value'. Returns false at the end of the
  // input or on a parse error; ok() tells the two apart. Once an error was
  // reported every further call returns false.
  bool Next(Value* value);

  bool ok() const { return error_.empty(); }
  // E.g. "Unexpected character 'x' at line 1, column 4".
  const string& error() const { return error_; }

  // Number of documents successfully read so far.
  int documents_read() const { return documents_read_; }

 private:
  bool ParseValue(int depth, Value* value);
  bool ParseString(string* value);
  bool ParseNumber(Value* value);
  bool ParseLiteral(absl::string_view literal);
  void SkipWhitespace();
  bool Fail(const string& message);

  const absl::string_view text_;
  size_t pos_ = 0;
  string error_;
  int documents_read_ = 0;
};

// Conversion between jq_path::Value and jsoncpp's Json::Value. jsoncpp
// objects keep their members sorted by key, so converting to Json::Value
// does not preserve member order.
Json::Value ToJsonCpp(const Value& value);
Value FromJsonCpp(const Json::Value& value);

}  // namespace json_utils
}  // namespace jq_path

#endif  // JQ_PATH_JSON_UTILS_H_
