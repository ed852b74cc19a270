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

#ifndef JQ_PATH_INTERNAL_MODEL_SELECT_H_
#define JQ_PATH_INTERNAL_MODEL_SELECT_H_

#include <memory>
#include <vector>

#include "jqpath/internal/model/node.h"

namespace jq_path {
namespace model {

// Evaluates 'predicate' against 'input' and sets 'truthy' to whether any of
// its outputs is truthy. Stops pulling at the first truthy output. Returns
// false if the predicate failed before producing one.
bool MatchesPredicate(const Node& predicate, const Value& input, bool* truthy,
                      QueryError* error);

// 'select(predicate)': yields its input once if the predicate holds for it,
// nothing otherwise. Placed after a wildcard ('.[] | select(...)') it filters
// the elements.
class Select : public Node {
 public:
  explicit Select(std::unique_ptr<const Node> predicate);
  ~Select() override = default;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  bool CollectPaths(const PathValue& input, PathMode mode,
                    std::vector<PathValue>* paths,
                    QueryError* error) const override;
  string DebugString() const override;

 private:
  const std::unique_ptr<const Node> predicate_;
};

}  // namespace model
}  // namespace jq_path

#endif  // JQ_PATH_INTERNAL_MODEL_SELECT_H_
