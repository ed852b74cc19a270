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

#include "jqpath/internal/model/builtins.h"

#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "absl/memory/memory.h"
#include "jqpath/internal/model/access.h"
#include "jqpath/internal/model/composition.h"
#include "jqpath/internal/model/construct.h"
#include "jqpath/internal/model/select.h"
#include "jqpath/internal/model/wildcard.h"
#include "jqpath/platform/test_util.h"

namespace jq_path {
namespace model {
namespace {

using ::testing::EqualsJson;
using ::testing::EqualsJsonList;

std::vector<Value> Evaluate(const Node& node, const string& input_json,
                            QueryError* error) {
  std::unique_ptr<ResultStream> stream =
      node.Evaluate(ParseJsonOrDie(input_json));
  std::vector<Value> results = CollectResults(stream.get());
  *error = stream->error();
  return results;
}

TEST(EmptyTest, YieldsNothing) {
  Empty empty;
  QueryError error;
  EXPECT_THAT(Evaluate(empty, "[1,2]", &error), EqualsJsonList("[]"));
  EXPECT_TRUE(error.ok());

  PathValue root;
  std::vector<PathValue> paths;
  EXPECT_TRUE(empty.CollectPaths(root, PathMode::kExisting, &paths, &error));
  EXPECT_TRUE(paths.empty());
}

TEST(NotTest, NegatesTruthiness) {
  Not negate;
  QueryError error;
  EXPECT_THAT(Evaluate(negate, "null", &error), EqualsJsonList("[true]"));
  EXPECT_THAT(Evaluate(negate, "false", &error), EqualsJsonList("[true]"));
  EXPECT_THAT(Evaluate(negate, "0", &error), EqualsJsonList("[false]"));
  EXPECT_THAT(Evaluate(negate, "[]", &error), EqualsJsonList("[false]"));
}

TEST(TypeFilterTest, Matches) {
  const Value values[] = {Value(),           Value(true),
                          Value(1),          Value("s"),
                          Value::EmptyArray(), Value::EmptyObject()};
  struct Case {
    TypeFilter::Kind kind;
    // One flag per entry of 'values'.
    bool expected[6];
  };
  const Case cases[] = {
      {TypeFilter::kArrays, {false, false, false, false, true, false}},
      {TypeFilter::kObjects, {false, false, false, false, false, true}},
      {TypeFilter::kIterables, {false, false, false, false, true, true}},
      {TypeFilter::kScalars, {true, true, true, true, false, false}},
      {TypeFilter::kBooleans, {false, true, false, false, false, false}},
      {TypeFilter::kNumbers, {false, false, true, false, false, false}},
      {TypeFilter::kStrings, {false, false, false, true, false, false}},
      {TypeFilter::kNulls, {true, false, false, false, false, false}},
      {TypeFilter::kValues, {false, true, true, true, true, true}},
  };
  for (const Case& test_case : cases) {
    const TypeFilter filter(test_case.kind);
    for (int i = 0; i < 6; ++i) {
      EXPECT_EQ(test_case.expected[i], filter.Matches(values[i]))
          << filter.DebugString() << " on " << values[i];
    }
  }
}

TEST(TypeFilterTest, Evaluate) {
  TypeFilter numbers(TypeFilter::kNumbers);
  QueryError error;
  EXPECT_THAT(Evaluate(numbers, "3", &error), EqualsJsonList("[3]"));
  EXPECT_THAT(Evaluate(numbers, "\"3\"", &error), EqualsJsonList("[]"));
  EXPECT_EQ("TypeFilter(numbers)", numbers.DebugString());
}

TEST(PathsTest, AllPathsInPreOrder) {
  Paths paths(nullptr);
  QueryError error;
  EXPECT_THAT(
      Evaluate(paths, "{\"a\":[1,{\"b\":2}],\"c\":3}", &error),
      EqualsJsonList("[[\"a\"],[\"a\",0],[\"a\",1],[\"a\",1,\"b\"],[\"c\"]]"));
  EXPECT_THAT(Evaluate(paths, "5", &error), EqualsJsonList("[]"));
  EXPECT_EQ("Paths", paths.DebugString());
}

TEST(PathsTest, FilteredPaths) {
  Paths paths(absl::make_unique<TypeFilter>(TypeFilter::kNumbers));
  QueryError error;
  EXPECT_THAT(Evaluate(paths, "{\"a\":[1,{\"b\":2}],\"c\":\"x\"}", &error),
              EqualsJsonList("[[\"a\",0],[\"a\",1,\"b\"]]"));
  EXPECT_EQ("Paths(TypeFilter(numbers))", paths.DebugString());
}

TEST(PathsTest, FilterErrorPropagates) {
  Paths paths(absl::make_unique<Key>("k", false));
  QueryError error;
  Evaluate(paths, "[1]", &error);
  EXPECT_EQ(ErrorCode::kTypeMismatch, error.code());
}

TEST(DeleteTest, RemovesKey) {
  Delete del(absl::make_unique<Key>("a", false));
  QueryError error;
  EXPECT_THAT(Evaluate(del, "{\"a\":1,\"b\":2}", &error),
              EqualsJsonList("[{\"b\":2}]"));
  // Deleting a missing key leaves the input unchanged.
  EXPECT_THAT(Evaluate(del, "{\"b\":2}", &error),
              EqualsJsonList("[{\"b\":2}]"));
  EXPECT_TRUE(error.ok());
  EXPECT_EQ("Delete(Key(\"a\"))", del.DebugString());
}

TEST(DeleteTest, RemovesSelectedElements) {
  // del(.[] | select(strings))
  Delete del(absl::make_unique<Pipe>(
      absl::make_unique<Wildcard>(false),
      absl::make_unique<Select>(absl::make_unique<TypeFilter>(
          TypeFilter::kStrings))));
  QueryError error;
  EXPECT_THAT(Evaluate(del, "[1,\"a\",2,\"b\",3]", &error),
              EqualsJsonList("[[1,2,3]]"));
}

TEST(DeleteTest, NonPathExpressionFails) {
  Delete del(absl::make_unique<Literal>(Value(1)));
  QueryError error;
  EXPECT_THAT(Evaluate(del, "{}", &error), EqualsJsonList("[]"));
  EXPECT_EQ(ErrorCode::kTypeMismatch, error.code());
  EXPECT_EQ("Invalid path expression: Literal(1)", error.message());
}

TEST(DeleteTest, DoesNotModifyInput) {
  Delete del(absl::make_unique<Index>(0, false));
  const Value input = ParseJsonOrDie("[1,2]");
  std::unique_ptr<ResultStream> stream = del.Evaluate(input);
  EXPECT_THAT(CollectResults(stream.get()), EqualsJsonList("[[2]]"));
  EXPECT_THAT(input, EqualsJson("[1,2]"));
}

}  // namespace
}  // namespace model
}  // namespace jq_path
