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

#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "absl/memory/memory.h"
#include "jqpath/internal/model/access.h"
#include "jqpath/internal/model/construct.h"
#include "jqpath/internal/testing/mock_node.h"
#include "jqpath/platform/test_util.h"

namespace jq_path {
namespace model {
namespace {

using ::testing::_;
using ::testing::EqualsJsonList;
using ::testing::NiceMock;

std::unique_ptr<const Node> MakeLiteral(const Value& value) {
  return absl::make_unique<Literal>(value);
}

std::vector<Value> Evaluate(const Node& node, const Value& input,
                            QueryError* error) {
  std::unique_ptr<ResultStream> stream = node.Evaluate(input);
  std::vector<Value> results = CollectResults(stream.get());
  *error = stream->error();
  return results;
}

TEST(ApplyCompareOpTest, AllOperators) {
  EXPECT_TRUE(ApplyCompareOp(CompareOp::kEqual, Value(1), Value(1.0)));
  EXPECT_FALSE(ApplyCompareOp(CompareOp::kEqual, Value(1), Value("1")));
  EXPECT_TRUE(ApplyCompareOp(CompareOp::kNotEqual, Value(1), Value("1")));
  EXPECT_TRUE(ApplyCompareOp(CompareOp::kLess, Value(1), Value(2)));
  EXPECT_TRUE(ApplyCompareOp(CompareOp::kLessEqual, Value(2), Value(2)));
  EXPECT_TRUE(ApplyCompareOp(CompareOp::kGreater, Value("b"), Value("a")));
  EXPECT_TRUE(
      ApplyCompareOp(CompareOp::kGreaterEqual, Value("a"), Value("a")));
}

TEST(ApplyCompareOpTest, CrossTypeOrderingNeverFails) {
  EXPECT_TRUE(ApplyCompareOp(CompareOp::kLess, Value(), Value(false)));
  EXPECT_TRUE(ApplyCompareOp(CompareOp::kLess, Value(false), Value(true)));
  EXPECT_TRUE(ApplyCompareOp(CompareOp::kLess, Value(true), Value(0)));
  EXPECT_TRUE(ApplyCompareOp(CompareOp::kLess, Value(100), Value("")));
  EXPECT_TRUE(
      ApplyCompareOp(CompareOp::kLess, Value("zzz"), Value::EmptyArray()));
  EXPECT_TRUE(ApplyCompareOp(CompareOp::kLess, Value::EmptyArray(),
                             Value::EmptyObject()));
  EXPECT_TRUE(ApplyCompareOp(CompareOp::kGreater, Value("10"), Value(9)));
}

TEST(CompareOpNameTest, Names) {
  EXPECT_STREQ("==", CompareOpName(CompareOp::kEqual));
  EXPECT_STREQ("!=", CompareOpName(CompareOp::kNotEqual));
  EXPECT_STREQ("<", CompareOpName(CompareOp::kLess));
  EXPECT_STREQ("<=", CompareOpName(CompareOp::kLessEqual));
  EXPECT_STREQ(">", CompareOpName(CompareOp::kGreater));
  EXPECT_STREQ(">=", CompareOpName(CompareOp::kGreaterEqual));
}

TEST(ComparisonTest, ComparesAgainstInput) {
  Comparison comparison(CompareOp::kGreater,
                        absl::make_unique<Key>("price", false),
                        MakeLiteral(Value(10)));
  QueryError error;
  EXPECT_THAT(Evaluate(comparison, ParseJsonOrDie("{\"price\":12.5}"), &error),
              EqualsJsonList("[true]"));
  EXPECT_THAT(Evaluate(comparison, ParseJsonOrDie("{\"price\":3}"), &error),
              EqualsJsonList("[false]"));
  EXPECT_EQ("Compare(>, Key(\"price\"), Literal(10))",
            comparison.DebugString());
}

TEST(ComparisonTest, CartesianProductRightSideOuter) {
  // (1,2) < (0,5) compares 1<0, 2<0, 1<5, 2<5.
  auto lhs = absl::make_unique<NiceMock<MockNode>>();
  auto rhs = absl::make_unique<NiceMock<MockNode>>();
  ON_CALL(*lhs, Evaluate(_))
      .WillByDefault(::testing::Invoke(
          [](const Value&) -> std::unique_ptr<ResultStream> {
            return absl::make_unique<ValueListStream>(
                std::vector<Value>{Value(1), Value(2)});
          }));
  ON_CALL(*rhs, Evaluate(_))
      .WillByDefault(::testing::Invoke(
          [](const Value&) -> std::unique_ptr<ResultStream> {
            return absl::make_unique<ValueListStream>(
                std::vector<Value>{Value(0), Value(5)});
          }));
  Comparison product(CompareOp::kLess, std::move(lhs), std::move(rhs));
  QueryError error;
  EXPECT_THAT(Evaluate(product, Value(), &error),
              EqualsJsonList("[false,false,true,true]"));
}

TEST(ComparisonTest, OperandErrorPropagates) {
  Comparison comparison(CompareOp::kEqual,
                        absl::make_unique<Key>("a", false),
                        MakeLiteral(Value(1)));
  QueryError error;
  EXPECT_THAT(Evaluate(comparison, Value(5), &error), EqualsJsonList("[]"));
  EXPECT_EQ(ErrorCode::kTypeMismatch, error.code());
}

TEST(BooleanOpTest, And) {
  BooleanOp op(BooleanOp::kAnd, absl::make_unique<Key>("a", false),
               absl::make_unique<Key>("b", false));
  QueryError error;
  EXPECT_THAT(Evaluate(op, ParseJsonOrDie("{\"a\":1,\"b\":\"x\"}"), &error),
              EqualsJsonList("[true]"));
  EXPECT_THAT(Evaluate(op, ParseJsonOrDie("{\"a\":1,\"b\":null}"), &error),
              EqualsJsonList("[false]"));
  // The right side is not evaluated when the left side is falsy, so the
  // missing key "b" is never looked up.
  EXPECT_THAT(Evaluate(op, ParseJsonOrDie("{\"a\":false}"), &error),
              EqualsJsonList("[false]"));
  EXPECT_TRUE(error.ok());
  EXPECT_EQ("And(Key(\"a\"), Key(\"b\"))", op.DebugString());
}

TEST(BooleanOpTest, Or) {
  BooleanOp op(BooleanOp::kOr, absl::make_unique<Key>("a", false),
               absl::make_unique<Key>("b", false));
  QueryError error;
  EXPECT_THAT(Evaluate(op, ParseJsonOrDie("{\"a\":true}"), &error),
              EqualsJsonList("[true]"));
  EXPECT_TRUE(error.ok());
  EXPECT_THAT(Evaluate(op, ParseJsonOrDie("{\"a\":null,\"b\":0}"), &error),
              EqualsJsonList("[true]"));
  EXPECT_THAT(Evaluate(op, ParseJsonOrDie("{\"a\":null}"), &error),
              EqualsJsonList("[]"));
  EXPECT_EQ(ErrorCode::kPathNotFound, error.code());
  EXPECT_EQ("Or(Key(\"a\"), Key(\"b\"))", op.DebugString());
}

}  // namespace
}  // namespace model
}  // namespace jq_path
