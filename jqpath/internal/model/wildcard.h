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

#ifndef JQ_PATH_INTERNAL_MODEL_WILDCARD_H_
#define JQ_PATH_INTERNAL_MODEL_WILDCARD_H_

#include <memory>
#include <vector>

#include "jqpath/internal/model/node.h"

namespace jq_path {
namespace model {

// '.[]' and '.*': yields every element of an array, or every member value of
// an object in insertion order. Other inputs fail with kTypeMismatch unless
// the wildcard is optional.
class Wildcard : public Node {
 public:
  explicit Wildcard(bool optional);
  ~Wildcard() override = default;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  bool CollectPaths(const PathValue& input, PathMode mode,
                    std::vector<PathValue>* paths,
                    QueryError* error) const override;
  string DebugString() const override;

 private:
  const bool optional_;
};

}  // namespace model
}  // namespace jq_path

#endif  // JQ_PATH_INTERNAL_MODEL_WILDCARD_H_
