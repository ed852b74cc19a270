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

#ifndef JQ_PATH_INTERNAL_MODEL_COMPARISON_H_
#define JQ_PATH_INTERNAL_MODEL_COMPARISON_H_

#include <memory>

#include "jqpath/internal/model/node.h"

namespace jq_path {
namespace model {

enum class CompareOp {
  kEqual = 0,
  kNotEqual,
  kLess,
  kLessEqual,
  kGreater,
  kGreaterEqual,
};

// Returns the operator's source text, e.g. "<=".
const char* CompareOpName(CompareOp op);

// Applies 'op' under the total order of Value::Compare(). Never fails, values
// of different types are simply ordered by type.
bool ApplyCompareOp(CompareOp op, const Value& lhs, const Value& rhs);

// 'lhs op rhs': yields a boolean for every pair of outputs, iterating the
// outputs of 'rhs' in the outer loop and those of 'lhs' in the inner loop.
class Comparison : public Node {
 public:
  Comparison(CompareOp op, std::unique_ptr<const Node> lhs,
             std::unique_ptr<const Node> rhs);
  ~Comparison() override = default;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  string DebugString() const override;

 private:
  const CompareOp op_;
  const std::unique_ptr<const Node> lhs_;
  const std::unique_ptr<const Node> rhs_;
};

// 'lhs and rhs' / 'lhs or rhs': short-circuiting boolean combinators using jq
// truthiness. 'rhs' is only evaluated for outputs of 'lhs' that do not decide
// the result on their own.
class BooleanOp : public Node {
 public:
  enum Kind { kAnd, kOr };

  BooleanOp(Kind kind, std::unique_ptr<const Node> lhs,
            std::unique_ptr<const Node> rhs);
  ~BooleanOp() override = default;

  std::unique_ptr<ResultStream> Evaluate(const Value& input) const override;
  string DebugString() const override;

 private:
  const Kind kind_;
  const std::unique_ptr<const Node> lhs_;
  const std::unique_ptr<const Node> rhs_;
};

}  // namespace model
}  // namespace jq_path

#endif  // JQ_PATH_INTERNAL_MODEL_COMPARISON_H_
