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

#include "jqpath/value.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include <glog/logging.h>

#include "jqpath/json_utils.h"
#include "jqpath/logging.h"

namespace jq_path {

namespace {

// Rank of each type in the total order. Booleans are split so that false
// sorts before true.
int TypeRank(const Value& value) {
  switch (value.type()) {
    case Value::kNull:
      return 0;
    case Value::kBoolean:
      return value.AsBool() ? 2 : 1;
    case Value::kNumber:
      return 3;
    case Value::kString:
      return 4;
    case Value::kArray:
      return 5;
    case Value::kObject:
      return 6;
  }
  return 0;
}

template <typename T>
int ThreeWay(const T& a, const T& b) {
  if (a < b) return -1;
  if (b < a) return 1;
  return 0;
}

int CompareNumbers(const Value& a, const Value& b) {
  if (a.IsInteger() && b.IsInteger()) {
    const bool a_unsigned = a.number_kind() == Value::kUInt64;
    const bool b_unsigned = b.number_kind() == Value::kUInt64;
    if (a_unsigned && b_unsigned) return ThreeWay(a.AsUInt64(), b.AsUInt64());
    // A uint64 value is always above the int64 range.
    if (a_unsigned) return 1;
    if (b_unsigned) return -1;
    return ThreeWay(a.AsInt64(), b.AsInt64());
  }
  const double x = a.AsDouble();
  const double y = b.AsDouble();
  // NaN sorts below every other number.
  if (std::isnan(x) || std::isnan(y)) {
    return ThreeWay(!std::isnan(x), !std::isnan(y));
  }
  return ThreeWay(x, y);
}

int CompareArrays(const Array& a, const Array& b) {
  const size_t n = std::min(a.size(), b.size());
  for (size_t i = 0; i < n; ++i) {
    const int result = a[i].Compare(b[i]);
    if (result != 0) return result;
  }
  return ThreeWay(a.size(), b.size());
}

// Objects compare first by their sorted key sets, then by the values of the
// keys in sorted order.
int CompareObjects(const Object& a, const Object& b) {
  const std::vector<string> a_keys = a.SortedKeys();
  const std::vector<string> b_keys = b.SortedKeys();
  const int key_result = [&a_keys, &b_keys]() {
    const size_t n = std::min(a_keys.size(), b_keys.size());
    for (size_t i = 0; i < n; ++i) {
      const int result = a_keys[i].compare(b_keys[i]);
      if (result != 0) return result < 0 ? -1 : 1;
    }
    return ThreeWay(a_keys.size(), b_keys.size());
  }();
  if (key_result != 0) return key_result;
  for (const string& key : a_keys) {
    const int result = a.Find(key)->Compare(*b.Find(key));
    if (result != 0) return result;
  }
  return 0;
}

const Array& EmptyArrayStorage() {
  static const auto* empty = new Array();
  return *empty;
}

const Object& EmptyObjectStorage() {
  static const auto* empty = new Object();
  return *empty;
}

const string& EmptyString() {
  static const auto* empty = new string();
  return *empty;
}

}  // namespace

Value::Value(bool value) : type_(kBoolean), bool_(value) {}

Value::Value(int32 value) : type_(kNumber), number_kind_(kInt64), int_(value) {}

Value::Value(uint32 value)
    : type_(kNumber), number_kind_(kInt64), int_(value) {}

Value::Value(int64 value) : type_(kNumber), number_kind_(kInt64), int_(value) {}

Value::Value(uint64 value) : type_(kNumber) {
  if (value <= static_cast<uint64>(std::numeric_limits<int64>::max())) {
    number_kind_ = kInt64;
    int_ = static_cast<int64>(value);
  } else {
    number_kind_ = kUInt64;
    uint_ = value;
  }
}

Value::Value(double value)
    : type_(kNumber), number_kind_(kDouble), double_(value) {}

Value::Value(const char* value) : type_(kString), string_(value) {}

Value::Value(const string& value) : type_(kString), string_(value) {}

Value::Value(string&& value) : type_(kString), string_(std::move(value)) {}

Value::Value(Array array)
    : type_(kArray), array_(std::make_shared<Array>(std::move(array))) {}

Value::Value(Object object)
    : type_(kObject), object_(std::make_shared<Object>(std::move(object))) {}

// static
Value Value::EmptyArray() { return Value(Array()); }

// static
Value Value::EmptyObject() { return Value(Object()); }

bool Value::AsBool() const {
  RETURN_FALSE_IF_MSG(!IsBoolean(), "AsBool() called on " << TypeName());
  return bool_;
}

int64 Value::AsInt64() const {
  RETURN_VALUE_IF_MSG(!IsNumber(), 0, "AsInt64() called on " << TypeName());
  switch (number_kind_) {
    case kInt64:
      return int_;
    case kUInt64:
      return std::numeric_limits<int64>::max();
    case kDouble:
      if (std::isnan(double_)) return 0;
      if (double_ >= 9.2233720368547758e18) {
        return std::numeric_limits<int64>::max();
      }
      if (double_ <= -9.2233720368547758e18) {
        return std::numeric_limits<int64>::min();
      }
      return static_cast<int64>(double_);
  }
  return 0;
}

uint64 Value::AsUInt64() const {
  RETURN_VALUE_IF_MSG(!IsNumber(), 0, "AsUInt64() called on " << TypeName());
  switch (number_kind_) {
    case kInt64:
      return int_ < 0 ? 0 : static_cast<uint64>(int_);
    case kUInt64:
      return uint_;
    case kDouble:
      if (!(double_ > 0)) return 0;
      if (double_ >= 1.8446744073709552e19) {
        return std::numeric_limits<uint64>::max();
      }
      return static_cast<uint64>(double_);
  }
  return 0;
}

double Value::AsDouble() const {
  RETURN_VALUE_IF_MSG(!IsNumber(), 0, "AsDouble() called on " << TypeName());
  switch (number_kind_) {
    case kInt64:
      return static_cast<double>(int_);
    case kUInt64:
      return static_cast<double>(uint_);
    case kDouble:
      return double_;
  }
  return 0;
}

const string& Value::AsString() const {
  RETURN_VALUE_IF_MSG(!IsString(), EmptyString(),
                      "AsString() called on " << TypeName());
  return string_;
}

const Array& Value::AsArray() const {
  RETURN_VALUE_IF_MSG(!IsArray(), EmptyArrayStorage(),
                      "AsArray() called on " << TypeName());
  return *array_;
}

const Object& Value::AsObject() const {
  RETURN_VALUE_IF_MSG(!IsObject(), EmptyObjectStorage(),
                      "AsObject() called on " << TypeName());
  return *object_;
}

Array* Value::MutableArray() {
  RETURN_NULL_IF(!IsArray());
  if (array_.use_count() > 1) {
    array_ = std::make_shared<Array>(*array_);
  }
  return array_.get();
}

Object* Value::MutableObject() {
  RETURN_NULL_IF(!IsObject());
  if (object_.use_count() > 1) {
    object_ = std::make_shared<Object>(*object_);
  }
  return object_.get();
}

size_t Value::size() const {
  if (IsArray()) return array_->size();
  if (IsObject()) return object_->size();
  return 0;
}

bool Value::Truthy() const {
  if (IsNull()) return false;
  if (IsBoolean()) return bool_;
  return true;
}

const char* Value::TypeName() const {
  switch (type_) {
    case kNull:
      return "null";
    case kBoolean:
      return "boolean";
    case kNumber:
      return "number";
    case kString:
      return "string";
    case kArray:
      return "array";
    case kObject:
      return "object";
  }
  return "unknown";
}

int Value::Compare(const Value& other) const {
  const int rank_result = ThreeWay(TypeRank(*this), TypeRank(other));
  if (rank_result != 0) return rank_result;
  switch (type_) {
    case kNull:
    case kBoolean:
      return 0;
    case kNumber:
      return CompareNumbers(*this, other);
    case kString: {
      const int result = string_.compare(other.string_);
      return result < 0 ? -1 : (result > 0 ? 1 : 0);
    }
    case kArray:
      if (array_ == other.array_) return 0;
      return CompareArrays(*array_, *other.array_);
    case kObject:
      if (object_ == other.object_) return 0;
      return CompareObjects(*object_, *other.object_);
  }
  return 0;
}

string Value::DebugString() const {
  return json_utils::WriteCompactJson(*this);
}

void Value::Swap(Value* other) {
  if (this == other) return;
  std::swap(type_, other->type_);
  std::swap(number_kind_, other->number_kind_);
  std::swap(bool_, other->bool_);
  std::swap(int_, other->int_);
  std::swap(uint_, other->uint_);
  std::swap(double_, other->double_);
  string_.swap(other->string_);
  array_.swap(other->array_);
  object_.swap(other->object_);
}

//------------------------------------------------------------------------------

Object::Object(std::initializer_list<Member> members) {
  for (const auto& member : members) {
    Set(member.first, member.second);
  }
}

bool Object::Contains(absl::string_view key) const {
  return index_.find(key) != index_.end();
}

const Value* Object::Find(absl::string_view key) const {
  auto it = index_.find(key);
  if (it == index_.end()) return nullptr;
  return &members_[it->second].second;
}

Value* Object::FindMutable(absl::string_view key) {
  auto it = index_.find(key);
  if (it == index_.end()) return nullptr;
  return &members_[it->second].second;
}

void Object::Set(const string& key, Value value) {
  auto it = index_.find(key);
  if (it != index_.end()) {
    members_[it->second].second = std::move(value);
    return;
  }
  index_.emplace(key, members_.size());
  members_.emplace_back(key, std::move(value));
}

bool Object::Erase(absl::string_view key) {
  auto it = index_.find(key);
  if (it == index_.end()) return false;
  members_.erase(members_.begin() + it->second);
  Reindex();
  return true;
}

std::vector<string> Object::SortedKeys() const {
  std::vector<string> keys;
  keys.reserve(members_.size());
  for (const auto& member : members_) {
    keys.push_back(member.first);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

void Object::Reindex() {
  index_.clear();
  for (size_t i = 0; i < members_.size(); ++i) {
    index_.emplace(members_[i].first, i);
  }
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
  return os << value.DebugString();
}

}  // namespace jq_path
