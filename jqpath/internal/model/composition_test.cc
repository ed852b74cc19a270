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

#include "jqpath/internal/model/composition.h"

#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "absl/memory/memory.h"
#include "jqpath/internal/model/access.h"
#include "jqpath/internal/model/wildcard.h"
#include "jqpath/internal/testing/mock_node.h"
#include "jqpath/platform/test_util.h"

namespace jq_path {
namespace model {
namespace {

using ::testing::_;
using ::testing::EqualsJson;
using ::testing::EqualsJsonList;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::NiceMock;

std::unique_ptr<const Node> MakeKey(const string& name) {
  return absl::make_unique<Key>(name, false);
}

std::unique_ptr<const Node> MakeWildcard() {
  return absl::make_unique<Wildcard>(false);
}

NodeList MakeList(std::unique_ptr<const Node> a,
                  std::unique_ptr<const Node> b) {
  NodeList list;
  list.push_back(std::move(a));
  list.push_back(std::move(b));
  return list;
}

TEST(PipeTest, FeedsEveryLeftOutputToTheRight) {
  Pipe pipe(MakeWildcard(), MakeKey("id"));
  std::unique_ptr<ResultStream> stream =
      pipe.Evaluate(ParseJsonOrDie("[{\"id\":1},{\"id\":2}]"));
  EXPECT_THAT(CollectResults(stream.get()), EqualsJsonList("[1,2]"));
  EXPECT_TRUE(stream->ok());
  EXPECT_EQ("Pipe(Wildcard, Key(\"id\"))", pipe.DebugString());
}

TEST(PipeTest, NestedWildcardsFlattenInOrder) {
  Pipe pipe(MakeWildcard(), MakeWildcard());
  std::unique_ptr<ResultStream> stream =
      pipe.Evaluate(ParseJsonOrDie("[[1,2],[],[3]]"));
  EXPECT_THAT(CollectResults(stream.get()), EqualsJsonList("[1,2,3]"));
}

TEST(PipeTest, ErrorOnLaterElementKeepsEarlierOutputs) {
  Pipe pipe(MakeWildcard(), MakeKey("id"));
  std::unique_ptr<ResultStream> stream =
      pipe.Evaluate(ParseJsonOrDie("[{\"id\":1},5,{\"id\":3}]"));
  EXPECT_THAT(CollectResults(stream.get()), EqualsJsonList("[1]"));
  EXPECT_EQ(ErrorCode::kTypeMismatch, stream->error().code());
}

TEST(PipeTest, RightSideIsEvaluatedOnDemand) {
  auto right = absl::make_unique<NiceMock<MockNode>>();
  NiceMock<MockNode>* right_ptr = right.get();
  Pipe pipe(MakeWildcard(), std::move(right));

  {
    InSequence sequence;
    EXPECT_CALL(*right_ptr, Evaluate(EqualsJson("1")));
    EXPECT_CALL(*right_ptr, Evaluate(EqualsJson("2")));
  }
  std::unique_ptr<ResultStream> stream =
      pipe.Evaluate(ParseJsonOrDie("[1,2,3,4]"));
  Value result;
  ASSERT_TRUE(stream->Next(&result));
  ASSERT_TRUE(stream->Next(&result));
  EXPECT_EQ(Value(2), result);
  // The remaining elements are never handed to the right side.
}

TEST(PipeTest, CollectPaths) {
  Pipe pipe(MakeKey("a"), MakeWildcard());
  PathValue root;
  root.value = ParseJsonOrDie("{\"a\":[7,8]}");
  std::vector<PathValue> paths;
  QueryError error;
  ASSERT_TRUE(pipe.CollectPaths(root, PathMode::kExisting, &paths, &error));
  ASSERT_EQ(2u, paths.size());
  EXPECT_THAT(PathToValue(paths[1].path), EqualsJson("[\"a\",1]"));
  EXPECT_EQ(Value(8), paths[1].value);
}

TEST(CommaTest, ConcatenatesBranches) {
  Comma comma(MakeList(MakeKey("a"), MakeKey("b")));
  std::unique_ptr<ResultStream> stream =
      comma.Evaluate(ParseJsonOrDie("{\"b\":2,\"a\":1}"));
  EXPECT_THAT(CollectResults(stream.get()), EqualsJsonList("[1,2]"));
  EXPECT_EQ("Comma(Key(\"a\"), Key(\"b\"))", comma.DebugString());
}

TEST(CommaTest, ErrorEndsStream) {
  Comma comma(MakeList(MakeKey("a"), MakeKey("missing")));
  std::unique_ptr<ResultStream> stream =
      comma.Evaluate(ParseJsonOrDie("{\"a\":1}"));
  EXPECT_THAT(CollectResults(stream.get()), EqualsJsonList("[1]"));
  EXPECT_EQ(ErrorCode::kPathNotFound, stream->error().code());
}

TEST(CommaTest, CollectPaths) {
  Comma comma(MakeList(MakeKey("a"), MakeKey("b")));
  PathValue root;
  root.value = ParseJsonOrDie("{\"a\":1}");
  std::vector<PathValue> paths;
  QueryError error;
  ASSERT_TRUE(comma.CollectPaths(root, PathMode::kCreate, &paths, &error));
  ASSERT_EQ(2u, paths.size());
  EXPECT_THAT(PathToValue(paths[0].path), EqualsJson("[\"a\"]"));
  EXPECT_THAT(PathToValue(paths[1].path), EqualsJson("[\"b\"]"));
  EXPECT_TRUE(paths[1].value.IsNull());
}

TEST(OptionalTest, SuppressesErrorsAndKeepsEarlierOutputs) {
  Optional optional(absl::make_unique<Pipe>(MakeWildcard(), MakeKey("id")));
  std::unique_ptr<ResultStream> stream =
      optional.Evaluate(ParseJsonOrDie("[{\"id\":1},5,{\"id\":3}]"));
  EXPECT_THAT(CollectResults(stream.get()), EqualsJsonList("[1]"));
  EXPECT_TRUE(stream->ok());
  EXPECT_EQ("Optional(Pipe(Wildcard, Key(\"id\")))", optional.DebugString());
}

TEST(OptionalTest, PassesThroughWithoutErrors) {
  auto term = absl::make_unique<NiceMock<MockNode>>();
  ON_CALL(*term, Evaluate(_)).WillByDefault(Invoke([](const Value& input) {
    return SingleValueStream(input);
  }));
  Optional optional(std::move(term));
  std::unique_ptr<ResultStream> stream = optional.Evaluate(Value("x"));
  EXPECT_THAT(CollectResults(stream.get()), EqualsJsonList("[\"x\"]"));
}

TEST(OptionalTest, CollectPathsDropsTheError) {
  Optional optional(MakeKey("a"));
  PathValue root;
  root.value = Value(1);
  std::vector<PathValue> paths;
  QueryError error;
  EXPECT_TRUE(optional.CollectPaths(root, PathMode::kCreate, &paths, &error));
  EXPECT_TRUE(paths.empty());
  EXPECT_TRUE(error.ok());
}

}  // namespace
}  // namespace model
}  // namespace jq_path
