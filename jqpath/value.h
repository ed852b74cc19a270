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

#ifndef JQ_PATH_VALUE_H_
#define JQ_PATH_VALUE_H_

#include <initializer_list>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/string_view.h"
#include "jqpath/platform/types.h"

namespace jq_path {

class Object;
class Value;

typedef std::vector<Value> Array;

// An in-memory JSON value: null, boolean, number, string, array or object.
//
// Arrays and objects are held in shared storage, so copying a Value is cheap
// and values handed out by the evaluator never alias mutable state. The
// Mutable*() accessors detach the storage before returning it (copy on
// write).
class Value {
 public:
  enum Type {
    kNull = 0,
    kBoolean,
    kNumber,
    kString,
    kArray,
    kObject,
  };

  // How a number is held. Integers are kept exactly; kUInt64 is only used for
  // values above the int64 range.
  enum NumberKind {
    kInt64 = 0,
    kUInt64,
    kDouble,
  };

  // Creates a null value.
  Value() = default;

  Value(bool value);  // NOLINT
  Value(int32 value);  // NOLINT
  Value(uint32 value);  // NOLINT
  Value(int64 value);  // NOLINT
  Value(uint64 value);  // NOLINT
  Value(double value);  // NOLINT
  Value(const char* value);  // NOLINT
  Value(const string& value);  // NOLINT
  Value(string&& value);  // NOLINT
  explicit Value(Array array);
  explicit Value(Object object);

  static Value EmptyArray();
  static Value EmptyObject();

  Type type() const { return type_; }
  NumberKind number_kind() const { return number_kind_; }

  bool IsNull() const { return type_ == kNull; }
  bool IsBoolean() const { return type_ == kBoolean; }
  bool IsNumber() const { return type_ == kNumber; }
  bool IsString() const { return type_ == kString; }
  bool IsArray() const { return type_ == kArray; }
  bool IsObject() const { return type_ == kObject; }
  // True for numbers held as int64 or uint64.
  bool IsInteger() const { return IsNumber() && number_kind_ != kDouble; }

  // Accessors. Calling an accessor on a value of another type is a
  // programming error; it logs DFATAL and returns a default.
  bool AsBool() const;
  int64 AsInt64() const;
  uint64 AsUInt64() const;
  double AsDouble() const;
  const string& AsString() const;
  const Array& AsArray() const;
  const Object& AsObject() const;

  // Returns the array or object storage for modification, detaching it from
  // other values that share it. Returns nullptr for other types.
  Array* MutableArray();
  Object* MutableObject();

  // Number of elements of an array or members of an object; 0 otherwise.
  size_t size() const;

  // jq truthiness: everything but null and false.
  bool Truthy() const;

  // The jq name of this value's type, e.g. "object".
  const char* TypeName() const;

  // Total ordering across all types:
  //   null < false < true < numbers < strings < arrays < objects.
  // Returns a negative number, zero or a positive number.
  int Compare(const Value& other) const;

  // Compact JSON text.
  string DebugString() const;

  void Swap(Value* other);

 private:
  Type type_ = kNull;
  NumberKind number_kind_ = kInt64;
  bool bool_ = false;
  int64 int_ = 0;
  uint64 uint_ = 0;
  double double_ = 0;
  string string_;
  std::shared_ptr<Array> array_;
  std::shared_ptr<Object> object_;
};

// An object: string keys mapped to values, iterated in insertion order. Keys
// are unique; setting an existing key replaces its value in place.
class Object {
 public:
  typedef std::pair<string, Value> Member;
  typedef std::vector<Member>::const_iterator const_iterator;

  Object() = default;
  Object(std::initializer_list<Member> members);

  size_t size() const { return members_.size(); }
  bool empty() const { return members_.empty(); }

  const_iterator begin() const { return members_.begin(); }
  const_iterator end() const { return members_.end(); }

  // The i-th member in insertion order.
  const Member& at(size_t i) const { return members_[i]; }

  bool Contains(absl::string_view key) const;

  // Returns nullptr if 'key' is not a member.
  const Value* Find(absl::string_view key) const;
  Value* FindMutable(absl::string_view key);

  // Inserts 'key' at the end or replaces the value of an existing member.
  void Set(const string& key, Value value);

  // Removes 'key'. Returns false if it was not a member.
  bool Erase(absl::string_view key);

  // Keys in byte-wise ascending order.
  std::vector<string> SortedKeys() const;

 private:
  void Reindex();

  std::vector<Member> members_;
  absl::flat_hash_map<string, size_t> index_;
};

inline bool operator==(const Value& a, const Value& b) {
  return a.Compare(b) == 0;
}
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }
inline bool operator<(const Value& a, const Value& b) {
  return a.Compare(b) < 0;
}

std::ostream& operator<<(std::ostream& os, const Value& value);

}  // namespace jq_path

#endif  // JQ_PATH_VALUE_H_
