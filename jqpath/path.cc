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

#include "jqpath/path.h"

#include <algorithm>
#include <utility>

#include <glog/logging.h>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "jqpath/logging.h"
#include "jqpath/platform/str_util.h"

namespace jq_path {

namespace {

// Padding an array beyond this index fails instead of allocating.
constexpr int64 kMaxArrayIndex = 536870912;

bool IsIdentifier(const string& key) {
  if (key.empty()) return false;
  if (!absl::ascii_isalpha(key[0]) && key[0] != '_') return false;
  for (const char c : key) {
    if (!absl::ascii_isalnum(c) && c != '_') return false;
  }
  return true;
}

// Resolves a possibly negative index against an array of 'size' elements.
// The result may still be out of range.
int64 ResolveIndex(int64 index, size_t size) {
  return index < 0 ? index + static_cast<int64>(size) : index;
}

QueryError CannotIndex(const Value& container, const PathElement& element) {
  return QueryError::TypeMismatch(absl::StrCat(
      "Cannot index ", container.TypeName(), " with ",
      element.is_key() ? absl::StrCat("\"", element.key(), "\"")
                       : string("number")));
}

bool SetAtPathImpl(const Path& path, size_t step, const Value& value,
                   Value* current, QueryError* error) {
  if (step == path.size()) {
    *current = value;
    return true;
  }
  const PathElement& element = path[step];
  if (element.is_key()) {
    if (current->IsNull()) *current = Value::EmptyObject();
    if (!current->IsObject()) {
      *error = CannotIndex(*current, element);
      return false;
    }
    Object* object = current->MutableObject();
    Value* child = object->FindMutable(element.key());
    if (child == nullptr) {
      object->Set(element.key(), Value());
      child = object->FindMutable(element.key());
    }
    return SetAtPathImpl(path, step + 1, value, child, error);
  }

  if (current->IsNull()) *current = Value::EmptyArray();
  if (!current->IsArray()) {
    *error = CannotIndex(*current, element);
    return false;
  }
  Array* array = current->MutableArray();
  const int64 index = ResolveIndex(element.index(), array->size());
  if (index < 0) {
    *error = QueryError::TypeMismatch("Out of bounds negative array index");
    return false;
  }
  if (index > kMaxArrayIndex) {
    *error = QueryError::TypeMismatch("Array index too large");
    return false;
  }
  if (static_cast<size_t>(index) >= array->size()) {
    array->resize(static_cast<size_t>(index) + 1);
  }
  return SetAtPathImpl(path, step + 1, value, &(*array)[index], error);
}

// Removes a single location. Missing locations are not an error.
bool DeleteAtPath(const Path& path, Value* root, QueryError* error) {
  if (path.empty()) {
    *root = Value();
    return true;
  }
  Value* current = root;
  for (size_t step = 0; step + 1 < path.size(); ++step) {
    const PathElement& element = path[step];
    if (current->IsNull()) return true;
    if (element.is_key()) {
      if (!current->IsObject()) {
        *error = CannotIndex(*current, element);
        return false;
      }
      current = current->MutableObject()->FindMutable(element.key());
      if (current == nullptr) return true;
    } else {
      if (!current->IsArray()) {
        *error = CannotIndex(*current, element);
        return false;
      }
      Array* array = current->MutableArray();
      const int64 index = ResolveIndex(element.index(), array->size());
      if (index < 0 || static_cast<size_t>(index) >= array->size()) {
        return true;
      }
      current = &(*array)[index];
    }
  }

  const PathElement& last = path.back();
  if (current->IsNull()) return true;
  if (last.is_key()) {
    if (!current->IsObject()) {
      *error = QueryError::TypeMismatch(absl::StrCat(
          "Cannot delete field \"", last.key(), "\" of ", current->TypeName()));
      return false;
    }
    current->MutableObject()->Erase(last.key());
    return true;
  }
  if (!current->IsArray()) {
    *error = QueryError::TypeMismatch(
        absl::StrCat("Cannot delete index of ", current->TypeName()));
    return false;
  }
  Array* array = current->MutableArray();
  const int64 index = ResolveIndex(last.index(), array->size());
  if (index >= 0 && static_cast<size_t>(index) < array->size()) {
    array->erase(array->begin() + index);
  }
  return true;
}

}  // namespace

// static
PathElement PathElement::Key(const string& key) {
  PathElement element;
  element.is_key_ = true;
  element.key_ = key;
  return element;
}

// static
PathElement PathElement::Index(int64 index) {
  PathElement element;
  element.is_key_ = false;
  element.index_ = index;
  return element;
}

Value PathElement::ToValue() const {
  return is_key_ ? Value(key_) : Value(index_);
}

bool operator==(const PathElement& a, const PathElement& b) {
  if (a.is_key() != b.is_key()) return false;
  return a.is_key() ? a.key() == b.key() : a.index() == b.index();
}

Value PathToValue(const Path& path) {
  Array array;
  array.reserve(path.size());
  for (const PathElement& element : path) {
    array.push_back(element.ToValue());
  }
  return Value(std::move(array));
}

string PathToString(const Path& path) {
  if (path.empty()) return ".";
  string result;
  for (const PathElement& element : path) {
    if (element.is_index()) {
      absl::StrAppend(&result, "[", element.index(), "]");
    } else if (IsIdentifier(element.key())) {
      absl::StrAppend(&result, ".", element.key());
    } else {
      result.append(".\"");
      strings::JsonEscape(element.key(), &result);
      result.push_back('"');
    }
  }
  return result;
}

bool SetAtPath(const Path& path, const Value& value, Value* root,
               QueryError* error) {
  RETURN_FALSE_IF(root == nullptr);
  RETURN_FALSE_IF(error == nullptr);
  return SetAtPathImpl(path, 0, value, root, error);
}

bool DeleteAtPaths(std::vector<Path> paths, Value* root, QueryError* error) {
  RETURN_FALSE_IF(root == nullptr);
  RETURN_FALSE_IF(error == nullptr);
  // Sort in descending order so that later array elements go first.
  std::sort(paths.begin(), paths.end(), [](const Path& a, const Path& b) {
    return PathToValue(b) < PathToValue(a);
  });
  paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
  for (const Path& path : paths) {
    if (!DeleteAtPath(path, root, error)) return false;
  }
  return true;
}

}  // namespace jq_path
