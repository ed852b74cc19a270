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

// IWYU pragma: private, include "jqpath/internal/model/model.h"
// IWYU pragma: friend jqpath/internal/model/*

#ifndef JQ_PATH_INTERNAL_MODEL_CONSTRUCT_H_
#define JQ_PATH_INTERNAL_MODEL_CONSTRUCT_H_

#include <memory>
#include <vector>

#include "jqpath/internal/model/node.h"

namespace jq_path {
namespace model {

// A constant: yields 'value' once per input, whatever the input is.
class Literal : public Node {
 public:
  explicit Literal(const Value& value);
  ~Literal() override = default;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  const Value* AsLiteral() const override { return &value_; }
  string DebugString() const override;

 private:
  const Value value_;
};

// '[body]': collects every output of 'body' into one array. '[]' has no body
// and yields an empty array.
class ArrayConstruct : public Node {
 public:
  // 'body' may be nullptr.
  explicit ArrayConstruct(std::unique_ptr<const Node> body);
  ~ArrayConstruct() override = default;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  string DebugString() const override;

 private:
  const std::unique_ptr<const Node> body_;
};

// One 'key: value' pair of an object construction.
struct ObjectEntry {
  std::unique_ptr<const Node> key;
  std::unique_ptr<const Node> value;
};

// '{key: value, ...}': builds objects from the outputs of the key and value
// expressions, each evaluated against the input. Keys must evaluate to
// strings. When an expression has several outputs one object is produced per
// combination, the later entries varying fastest.
class ObjectConstruct : public Node {
 public:
  explicit ObjectConstruct(std::vector<ObjectEntry> entries);
  ~ObjectConstruct() override = default;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  string DebugString() const override;

 private:
  const std::vector<ObjectEntry> entries_;
};

}  // namespace model
}  // namespace jq_path

#endif  // JQ_PATH_INTERNAL_MODEL_CONSTRUCT_H_
