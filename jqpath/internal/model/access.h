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

#ifndef JQ_PATH_INTERNAL_MODEL_ACCESS_H_
#define JQ_PATH_INTERNAL_MODEL_ACCESS_H_

#include <memory>
#include <string>
#include <vector>

#include "jqpath/internal/model/node.h"
#include "jqpath/platform/types.h"

namespace jq_path {
namespace model {

// '.': yields its input unchanged.
class Identity : public Node {
 public:
  Identity() = default;
  ~Identity() override = default;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  bool CollectPaths(const PathValue& input, PathMode mode,
                    std::vector<PathValue>* paths,
                    QueryError* error) const override;
  string DebugString() const override { return "Identity"; }
};

// '.name' and '.["name"]': object member access.
class Key : public Node {
 public:
  // An optional key ('.name?') yields nothing where a plain key would fail.
  Key(const string& name, bool optional);
  ~Key() override = default;

  // Fails with kPathNotFound for a missing member and with kTypeMismatch if
  // the input is not an object.
  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  bool CollectPaths(const PathValue& input, PathMode mode,
                    std::vector<PathValue>* paths,
                    QueryError* error) const override;
  string DebugString() const override;

  const string& name() const { return name_; }
  bool optional() const { return optional_; }

 private:
  const string name_;
  const bool optional_;
};

// '.[i]': array element access. Negative indices count from the end; an index
// outside the array yields nothing.
class Index : public Node {
 public:
  Index(int64 index, bool optional);
  ~Index() override = default;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  bool CollectPaths(const PathValue& input, PathMode mode,
                    std::vector<PathValue>* paths,
                    QueryError* error) const override;
  string DebugString() const override;

  int64 index() const { return index_; }
  bool optional() const { return optional_; }

 private:
  const int64 index_;
  const bool optional_;
};

// '.[start:end]': the elements from 'start' up to, not including, 'end'.
// Either bound may be omitted; negative bounds count from the end and bounds
// are clamped to the array. A null input yields null.
class Slice : public Node {
 public:
  Slice(bool has_start, int64 start, bool has_end, int64 end, bool optional);
  ~Slice() override = default;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  string DebugString() const override;

 private:
  const bool has_start_;
  const int64 start_;
  const bool has_end_;
  const int64 end_;
  const bool optional_;
};

}  // namespace model
}  // namespace jq_path

#endif  // JQ_PATH_INTERNAL_MODEL_ACCESS_H_
