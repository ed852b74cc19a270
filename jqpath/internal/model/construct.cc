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

#include "jqpath/internal/model/construct.h"

#include <utility>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "jqpath/internal/streams.h"

namespace jq_path {
namespace model {

namespace {

typedef std::pair<string, Value> KeyValue;

// Appends every (key, value) combination produced by 'entry' for 'input'.
bool EvaluateEntry(const ObjectEntry& entry, const Value& input,
                   std::vector<KeyValue>* pairs, QueryError* error) {
  std::vector<Value> keys;
  std::unique_ptr<ResultStream> key_stream = entry.key->Evaluate(input);
  if (!DrainStream(key_stream.get(), &keys, error)) return false;
  for (const Value& key : keys) {
    if (!key.IsString()) {
      *error = QueryError::TypeMismatch(absl::StrCat(
          "Object keys must be strings, got ", key.TypeName()));
      return false;
    }
  }

  std::vector<Value> values;
  std::unique_ptr<ResultStream> value_stream = entry.value->Evaluate(input);
  if (!DrainStream(value_stream.get(), &values, error)) return false;

  for (const Value& key : keys) {
    for (const Value& value : values) {
      pairs->emplace_back(key.AsString(), value);
    }
  }
  return true;
}

}  // namespace

Literal::Literal(const Value& value) : value_(value) {}

// override
std::unique_ptr<ResultStream> Literal::Evaluate(const Value& input) const {
  return SingleValueStream(value_);
}

// override
string Literal::DebugString() const {
  return absl::StrCat("Literal(", value_.DebugString(), ")");
}

//------------------------------------------------------------------------------

ArrayConstruct::ArrayConstruct(std::unique_ptr<const Node> body)
    : body_(std::move(body)) {}

// override
std::unique_ptr<ResultStream> ArrayConstruct::Evaluate(
    const Value& input) const {
  Array elements;
  if (body_ != nullptr) {
    std::unique_ptr<ResultStream> outputs = body_->Evaluate(input);
    QueryError error;
    if (!DrainStream(outputs.get(), &elements, &error)) {
      return ErrorStream(error);
    }
  }
  return SingleValueStream(Value(std::move(elements)));
}

// override
string ArrayConstruct::DebugString() const {
  if (body_ == nullptr) return "Array()";
  return absl::StrCat("Array(", body_->DebugString(), ")");
}

//------------------------------------------------------------------------------

ObjectConstruct::ObjectConstruct(std::vector<ObjectEntry> entries)
    : entries_(std::move(entries)) {}

// override
std::unique_ptr<ResultStream> ObjectConstruct::Evaluate(
    const Value& input) const {
  // Partial objects, extended entry by entry.
  std::vector<Object> objects(1);
  for (const ObjectEntry& entry : entries_) {
    std::vector<KeyValue> pairs;
    QueryError error;
    if (!EvaluateEntry(entry, input, &pairs, &error)) {
      return ErrorStream(error);
    }
    std::vector<Object> extended;
    extended.reserve(objects.size() * pairs.size());
    for (const Object& object : objects) {
      for (const KeyValue& pair : pairs) {
        extended.push_back(object);
        extended.back().Set(pair.first, pair.second);
      }
    }
    objects.swap(extended);
  }

  std::vector<Value> results;
  results.reserve(objects.size());
  for (Object& object : objects) {
    results.emplace_back(std::move(object));
  }
  return absl::make_unique<ValueListStream>(std::move(results));
}

// override
string ObjectConstruct::DebugString() const {
  return absl::StrCat(
      "Object(",
      absl::StrJoin(entries_, ", ",
                    [](string* out, const ObjectEntry& entry) {
                      absl::StrAppend(out, entry.key->DebugString(), ": ",
                                      entry.value->DebugString());
                    }),
      ")");
}

}  // namespace model
}  // namespace jq_path
