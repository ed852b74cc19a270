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

// Nodes behind the built-in functions other than select().

#ifndef JQ_PATH_INTERNAL_MODEL_BUILTINS_H_
#define JQ_PATH_INTERNAL_MODEL_BUILTINS_H_

#include <memory>
#include <string>
#include <vector>

#include "jqpath/internal/model/node.h"
#include "jqpath/platform/types.h"

namespace jq_path {
namespace model {

// 'empty': yields nothing.
class Empty : public Node {
 public:
  Empty() = default;
  ~Empty() override = default;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  bool CollectPaths(const PathValue& input, PathMode mode,
                    std::vector<PathValue>* paths,
                    QueryError* error) const override;
  string DebugString() const override { return "Empty"; }
};

// 'not': the negated truthiness of its input.
class Not : public Node {
 public:
  Not() = default;
  ~Not() override = default;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  string DebugString() const override { return "Not"; }
};

// 'arrays', 'objects', 'numbers', ...: yields its input if it is of the
// selected kind, nothing otherwise.
class TypeFilter : public Node {
 public:
  enum Kind {
    kArrays = 0,
    kObjects,
    kIterables,
    kScalars,
    kBooleans,
    kNumbers,
    kStrings,
    kNulls,
    kValues,
  };

  explicit TypeFilter(Kind kind);
  ~TypeFilter() override = default;

  // Returns true if 'value' is of the kind this filter keeps.
  bool Matches(const Value& value) const;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  bool CollectPaths(const PathValue& input, PathMode mode,
                    std::vector<PathValue>* paths,
                    QueryError* error) const override;
  string DebugString() const override;

 private:
  const Kind kind_;
};

// 'paths' and 'paths(f)': yields, as arrays of keys and indices, the path of
// every value below the input in pre-order. With a filter only the paths whose
// value satisfies 'f' are yielded.
class Paths : public Node {
 public:
  // 'filter' may be nullptr.
  explicit Paths(std::unique_ptr<const Node> filter);
  ~Paths() override = default;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  string DebugString() const override;

 private:
  const std::unique_ptr<const Node> filter_;
};

// 'del(f)': yields the input with every location addressed by the path
// expression 'f' removed.
class Delete : public Node {
 public:
  explicit Delete(std::unique_ptr<const Node> locations);
  ~Delete() override = default;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  string DebugString() const override;

 private:
  const std::unique_ptr<const Node> locations_;
};

}  // namespace model
}  // namespace jq_path

#endif  // JQ_PATH_INTERNAL_MODEL_BUILTINS_H_
