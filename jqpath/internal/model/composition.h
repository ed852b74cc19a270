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

#ifndef JQ_PATH_INTERNAL_MODEL_COMPOSITION_H_
#define JQ_PATH_INTERNAL_MODEL_COMPOSITION_H_

#include <memory>
#include <vector>

#include "jqpath/internal/model/node.h"

namespace jq_path {
namespace model {

// 'left | right': every output of 'left' is fed to 'right'. The outputs are
// ordered by the left output that produced them, then by the order 'right'
// produced them in.
class Pipe : public Node {
 public:
  Pipe(std::unique_ptr<const Node> left, std::unique_ptr<const Node> right);
  ~Pipe() override = default;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  bool CollectPaths(const PathValue& input, PathMode mode,
                    std::vector<PathValue>* paths,
                    QueryError* error) const override;
  string DebugString() const override;

 private:
  const std::unique_ptr<const Node> left_;
  const std::unique_ptr<const Node> right_;
};

// 'a, b, ...': the outputs of each branch for the same input, one branch after
// the other.
class Comma : public Node {
 public:
  explicit Comma(NodeList branches);
  ~Comma() override = default;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  bool CollectPaths(const PathValue& input, PathMode mode,
                    std::vector<PathValue>* paths,
                    QueryError* error) const override;
  string DebugString() const override;

 private:
  const NodeList branches_;
};

// 'term?': the outputs of 'term' up to its first error, which is dropped.
class Optional : public Node {
 public:
  explicit Optional(std::unique_ptr<const Node> term);
  ~Optional() override = default;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  bool CollectPaths(const PathValue& input, PathMode mode,
                    std::vector<PathValue>* paths,
                    QueryError* error) const override;
  string DebugString() const override;

 private:
  const std::unique_ptr<const Node> term_;
};

}  // namespace model
}  // namespace jq_path

#endif  // JQ_PATH_INTERNAL_MODEL_COMPOSITION_H_
