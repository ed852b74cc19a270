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

#include "jqpath/internal/model/comparison.h"

#include <utility>
#include <vector>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "jqpath/internal/streams.h"

namespace jq_path {
namespace model {

const char* CompareOpName(CompareOp op) {
  switch (op) {
    case CompareOp::kEqual:
      return "==";
    case CompareOp::kNotEqual:
      return "!=";
    case CompareOp::kLess:
      return "<";
    case CompareOp::kLessEqual:
      return "<=";
    case CompareOp::kGreater:
      return ">";
    case CompareOp::kGreaterEqual:
      return ">=";
  }
  return "?";
}

bool ApplyCompareOp(CompareOp op, const Value& lhs, const Value& rhs) {
  const int result = lhs.Compare(rhs);
  switch (op) {
    case CompareOp::kEqual:
      return result == 0;
    case CompareOp::kNotEqual:
      return result != 0;
    case CompareOp::kLess:
      return result < 0;
    case CompareOp::kLessEqual:
      return result <= 0;
    case CompareOp::kGreater:
      return result > 0;
    case CompareOp::kGreaterEqual:
      return result >= 0;
  }
  return false;
}

Comparison::Comparison(CompareOp op, std::unique_ptr<const Node> lhs,
                       std::unique_ptr<const Node> rhs)
    : op_(op), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

// override
std::unique_ptr<ResultStream> Comparison::Evaluate(const Value& input) const {
  QueryError error;
  std::vector<Value> rhs_values;
  std::unique_ptr<ResultStream> rhs_stream = rhs_->Evaluate(input);
  if (!DrainStream(rhs_stream.get(), &rhs_values, &error)) {
    return ErrorStream(error);
  }
  std::vector<Value> lhs_values;
  std::unique_ptr<ResultStream> lhs_stream = lhs_->Evaluate(input);
  if (!DrainStream(lhs_stream.get(), &lhs_values, &error)) {
    return ErrorStream(error);
  }

  std::vector<Value> results;
  results.reserve(rhs_values.size() * lhs_values.size());
  for (const Value& rhs : rhs_values) {
    for (const Value& lhs : lhs_values) {
      results.emplace_back(ApplyCompareOp(op_, lhs, rhs));
    }
  }
  return absl::make_unique<ValueListStream>(std::move(results));
}

// override
string Comparison::DebugString() const {
  return absl::StrCat("Compare(", CompareOpName(op_), ", ",
                      lhs_->DebugString(), ", ", rhs_->DebugString(), ")");
}

//------------------------------------------------------------------------------

BooleanOp::BooleanOp(Kind kind, std::unique_ptr<const Node> lhs,
                     std::unique_ptr<const Node> rhs)
    : kind_(kind), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

// override
std::unique_ptr<ResultStream> BooleanOp::Evaluate(const Value& input) const {
  // The value of the left side that settles the result without the right.
  const bool deciding = kind_ == kOr;
  std::vector<Value> results;
  std::unique_ptr<ResultStream> lhs_stream = lhs_->Evaluate(input);
  Value lhs;
  while (lhs_stream->Next(&lhs)) {
    if (lhs.Truthy() == deciding) {
      results.emplace_back(deciding);
      continue;
    }
    std::unique_ptr<ResultStream> rhs_stream = rhs_->Evaluate(input);
    Value rhs;
    while (rhs_stream->Next(&rhs)) {
      results.emplace_back(rhs.Truthy());
    }
    if (!rhs_stream->ok()) {
      return absl::make_unique<ValueListStream>(std::move(results),
                                                rhs_stream->error());
    }
  }
  if (!lhs_stream->ok()) {
    return absl::make_unique<ValueListStream>(std::move(results),
                                              lhs_stream->error());
  }
  return absl::make_unique<ValueListStream>(std::move(results));
}

// override
string BooleanOp::DebugString() const {
  return absl::StrCat(kind_ == kAnd ? "And(" : "Or(", lhs_->DebugString(),
                      ", ", rhs_->DebugString(), ")");
}

}  // namespace model
}  // namespace jq_path
