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

#include "jqpath/internal/model/access.h"

#include <algorithm>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"
#include "jqpath/internal/streams.h"

namespace jq_path {
namespace model {

namespace {

string QuoteKey(const string& name) { return Value(name).DebugString(); }

QueryError CannotIndexWithKey(const Value& input, const string& name) {
  return QueryError::TypeMismatch(absl::StrCat(
      "Cannot index ", input.TypeName(), " with ", QuoteKey(name)));
}

QueryError CannotIndexWithNumber(const Value& input) {
  return QueryError::TypeMismatch(
      absl::StrCat("Cannot index ", input.TypeName(), " with number"));
}

// Resolves a negative index. Returns false if the result is outside
// [0, size).
bool ResolveIndex(int64 index, size_t size, size_t* resolved) {
  const int64 length = static_cast<int64>(size);
  if (index < 0) index += length;
  if (index < 0 || index >= length) return false;
  *resolved = static_cast<size_t>(index);
  return true;
}

// Clamps a slice bound to [0, size], resolving negative values first.
size_t ClampBound(int64 bound, size_t size) {
  const int64 length = static_cast<int64>(size);
  if (bound < 0) bound += length;
  return static_cast<size_t>(std::max<int64>(0, std::min(bound, length)));
}

}  // namespace

// override
std::unique_ptr<ResultStream> Identity::Evaluate(const Value& input) const {
  return SingleValueStream(input);
}

// override
bool Identity::CollectPaths(const PathValue& input, PathMode mode,
                            std::vector<PathValue>* paths,
                            QueryError* error) const {
  paths->push_back(input);
  return true;
}

//------------------------------------------------------------------------------

Key::Key(const string& name, bool optional)
    : name_(name), optional_(optional) {}

// override
std::unique_ptr<ResultStream> Key::Evaluate(const Value& input) const {
  if (!input.IsObject()) {
    if (optional_) return EmptyStream();
    return ErrorStream(CannotIndexWithKey(input, name_));
  }
  const Value* member = input.AsObject().Find(name_);
  if (member == nullptr) {
    if (optional_) return EmptyStream();
    return ErrorStream(QueryError::PathNotFound(
        absl::StrCat("Key ", QuoteKey(name_), " not found")));
  }
  return SingleValueStream(*member);
}

// override
bool Key::CollectPaths(const PathValue& input, PathMode mode,
                       std::vector<PathValue>* paths,
                       QueryError* error) const {
  const Value* member = nullptr;
  if (input.value.IsObject()) {
    member = input.value.AsObject().Find(name_);
  } else if (!input.value.IsNull()) {
    if (optional_) return true;
    *error = CannotIndexWithKey(input.value, name_);
    return false;
  }

  if (member == nullptr && mode == PathMode::kExisting) {
    if (optional_) return true;
    *error = QueryError::PathNotFound(absl::StrCat(
        "Key ", QuoteKey(name_), " not found at ", PathToString(input.path)));
    return false;
  }

  PathValue result;
  result.path = input.path;
  result.path.push_back(PathElement::Key(name_));
  if (member != nullptr) result.value = *member;
  paths->push_back(std::move(result));
  return true;
}

// override
string Key::DebugString() const {
  return absl::StrCat("Key(", QuoteKey(name_), ")", optional_ ? "?" : "");
}

//------------------------------------------------------------------------------

Index::Index(int64 index, bool optional) : index_(index), optional_(optional) {}

// override
std::unique_ptr<ResultStream> Index::Evaluate(const Value& input) const {
  if (!input.IsArray()) {
    if (optional_) return EmptyStream();
    return ErrorStream(CannotIndexWithNumber(input));
  }
  size_t resolved = 0;
  if (!ResolveIndex(index_, input.size(), &resolved)) return EmptyStream();
  return SingleValueStream(input.AsArray()[resolved]);
}

// override
bool Index::CollectPaths(const PathValue& input, PathMode mode,
                         std::vector<PathValue>* paths,
                         QueryError* error) const {
  if (!input.value.IsArray() && !input.value.IsNull()) {
    if (optional_) return true;
    *error = CannotIndexWithNumber(input.value);
    return false;
  }

  PathValue result;
  result.path = input.path;
  size_t resolved = 0;
  if (input.value.IsArray() &&
      ResolveIndex(index_, input.value.size(), &resolved)) {
    result.path.push_back(PathElement::Index(static_cast<int64>(resolved)));
    result.value = input.value.AsArray()[resolved];
  } else if (mode == PathMode::kExisting) {
    if (optional_) return true;
    *error = QueryError::PathNotFound(absl::Substitute(
        "Index $0 not found at $1", index_, PathToString(input.path)));
    return false;
  } else {
    result.path.push_back(PathElement::Index(index_));
  }
  paths->push_back(std::move(result));
  return true;
}

// override
string Index::DebugString() const {
  return absl::StrCat("Index(", index_, ")", optional_ ? "?" : "");
}

//------------------------------------------------------------------------------

Slice::Slice(bool has_start, int64 start, bool has_end, int64 end,
             bool optional)
    : has_start_(has_start),
      start_(start),
      has_end_(has_end),
      end_(end),
      optional_(optional) {}

// override
std::unique_ptr<ResultStream> Slice::Evaluate(const Value& input) const {
  if (input.IsNull()) return SingleValueStream(Value());
  if (!input.IsArray()) {
    if (optional_) return EmptyStream();
    return ErrorStream(QueryError::TypeMismatch(
        absl::StrCat("Cannot slice ", input.TypeName())));
  }
  const Array& array = input.AsArray();
  const size_t begin = has_start_ ? ClampBound(start_, array.size()) : 0;
  const size_t end =
      has_end_ ? ClampBound(end_, array.size()) : array.size();
  Array result;
  if (begin < end) {
    result.assign(array.begin() + begin, array.begin() + end);
  }
  return SingleValueStream(Value(std::move(result)));
}

// override
string Slice::DebugString() const {
  return absl::StrCat("Slice(", has_start_ ? absl::StrCat(start_) : "null",
                      ", ", has_end_ ? absl::StrCat(end_) : "null", ")",
                      optional_ ? "?" : "");
}

}  // namespace model
}  // namespace jq_path
