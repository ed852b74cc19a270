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

// Concrete locations inside a Value, and the primitive updates applied at
// them.

#ifndef JQ_PATH_PATH_H_
#define JQ_PATH_PATH_H_

#include <string>
#include <vector>

#include "jqpath/error.h"
#include "jqpath/platform/types.h"
#include "jqpath/value.h"

namespace jq_path {

// One step of a Path: an object key or an array index.
class PathElement {
 public:
  static PathElement Key(const string& key);
  static PathElement Index(int64 index);

  bool is_key() const { return is_key_; }
  bool is_index() const { return !is_key_; }
  const string& key() const { return key_; }
  int64 index() const { return index_; }

  // The element as it appears in a jq path array: a string or a number.
  Value ToValue() const;

 private:
  PathElement() = default;

  bool is_key_ = false;
  string key_;
  int64 index_ = 0;
};

bool operator==(const PathElement& a, const PathElement& b);

typedef std::vector<PathElement> Path;

// E.g. ["a", 0, "b c"].
Value PathToValue(const Path& path);

// E.g. .a[0]."b c". The empty path renders as ".".
string PathToString(const Path& path);

// Stores 'value' at 'path' inside '*root'. Missing object members are
// created, arrays are padded with nulls up to the addressed index and null
// intermediate values become objects or arrays as needed. Fails with
// kTypeMismatch when a step addresses a value that is neither null nor of the
// right container type, when a negative index is out of range, or when an
// index is above 536870912.
bool SetAtPath(const Path& path, const Value& value, Value* root,
               QueryError* error);

// Removes every location in 'paths' from '*root'. Locations that do not exist
// are ignored. Paths are applied from the last location to the first so that
// removing an array element does not shift the indices of other paths.
// Fails with kTypeMismatch if a step addresses a value of the wrong type.
bool DeleteAtPaths(std::vector<Path> paths, Value* root, QueryError* error);

}  // namespace jq_path

#endif  // JQ_PATH_PATH_H_
