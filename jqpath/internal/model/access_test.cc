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

#include "jqpath/internal/model/access.h"

#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "jqpath/platform/test_util.h"

namespace jq_path {
namespace model {
namespace {

using ::testing::EqualsJson;
using ::testing::EqualsJsonList;

class AccessTest : public ::testing::Test {
 protected:
  // Evaluates 'node' against 'input_json' and keeps the final stream state in
  // 'error_'.
  std::vector<Value> Evaluate(const Node& node, const string& input_json) {
    std::unique_ptr<ResultStream> stream =
        node.Evaluate(ParseJsonOrDie(input_json));
    std::vector<Value> results = CollectResults(stream.get());
    error_ = stream->error();
    return results;
  }

  std::vector<PathValue> CollectPaths(const Node& node,
                                      const string& input_json,
                                      PathMode mode) {
    PathValue root;
    root.value = ParseJsonOrDie(input_json);
    std::vector<PathValue> paths;
    error_ = QueryError();
    collected_ = node.CollectPaths(root, mode, &paths, &error_);
    return paths;
  }

  QueryError error_;
  bool collected_ = false;
};

TEST_F(AccessTest, Identity) {
  Identity identity;
  EXPECT_THAT(Evaluate(identity, "{\"a\":1}"),
              EqualsJsonList("[{\"a\":1}]"));
  EXPECT_EQ("Identity", identity.DebugString());

  const std::vector<PathValue> paths =
      CollectPaths(identity, "[1]", PathMode::kExisting);
  ASSERT_TRUE(collected_);
  ASSERT_EQ(1u, paths.size());
  EXPECT_TRUE(paths[0].path.empty());
  EXPECT_THAT(paths[0].value, EqualsJson("[1]"));
}

TEST_F(AccessTest, KeyFound) {
  Key key("a", false);
  EXPECT_THAT(Evaluate(key, "{\"a\":{\"b\":2}}"),
              EqualsJsonList("[{\"b\":2}]"));
  EXPECT_TRUE(error_.ok());
  EXPECT_EQ("Key(\"a\")", key.DebugString());
  EXPECT_EQ("Key(\"a\")?", Key("a", true).DebugString());
}

TEST_F(AccessTest, KeyMissing) {
  Key key("missing", false);
  EXPECT_THAT(Evaluate(key, "{\"a\":1}"), EqualsJsonList("[]"));
  EXPECT_EQ(ErrorCode::kPathNotFound, error_.code());
  EXPECT_EQ("Key \"missing\" not found", error_.message());

  Key optional("missing", true);
  EXPECT_THAT(Evaluate(optional, "{\"a\":1}"), EqualsJsonList("[]"));
  EXPECT_TRUE(error_.ok());
}

TEST_F(AccessTest, KeyOnNonObject) {
  Key key("a", false);
  EXPECT_THAT(Evaluate(key, "[1,2]"), EqualsJsonList("[]"));
  EXPECT_EQ(ErrorCode::kTypeMismatch, error_.code());
  EXPECT_EQ("Cannot index array with \"a\"", error_.message());

  Evaluate(key, "null");
  EXPECT_EQ(ErrorCode::kTypeMismatch, error_.code());

  Key optional("a", true);
  EXPECT_THAT(Evaluate(optional, "\"text\""), EqualsJsonList("[]"));
  EXPECT_TRUE(error_.ok());
}

TEST_F(AccessTest, KeyPaths) {
  Key key("a", false);
  std::vector<PathValue> paths =
      CollectPaths(key, "{\"a\":3}", PathMode::kExisting);
  ASSERT_TRUE(collected_);
  ASSERT_EQ(1u, paths.size());
  EXPECT_THAT(PathToValue(paths[0].path), EqualsJson("[\"a\"]"));
  EXPECT_EQ(Value(3), paths[0].value);

  paths = CollectPaths(key, "{}", PathMode::kExisting);
  EXPECT_FALSE(collected_);
  EXPECT_EQ(ErrorCode::kPathNotFound, error_.code());

  paths = CollectPaths(key, "{}", PathMode::kCreate);
  ASSERT_TRUE(collected_);
  ASSERT_EQ(1u, paths.size());
  EXPECT_TRUE(paths[0].value.IsNull());

  // A null input is a place where members can be created.
  paths = CollectPaths(key, "null", PathMode::kCreate);
  ASSERT_TRUE(collected_);
  EXPECT_EQ(1u, paths.size());

  paths = CollectPaths(key, "5", PathMode::kCreate);
  EXPECT_FALSE(collected_);
  EXPECT_EQ(ErrorCode::kTypeMismatch, error_.code());
}

TEST_F(AccessTest, Index) {
  EXPECT_THAT(Evaluate(Index(0, false), "[\"x\",\"y\"]"),
              EqualsJsonList("[\"x\"]"));
  EXPECT_THAT(Evaluate(Index(-1, false), "[\"x\",\"y\"]"),
              EqualsJsonList("[\"y\"]"));
  // Out of range yields nothing.
  EXPECT_THAT(Evaluate(Index(5, false), "[\"x\"]"), EqualsJsonList("[]"));
  EXPECT_TRUE(error_.ok());
  EXPECT_THAT(Evaluate(Index(-5, false), "[\"x\"]"), EqualsJsonList("[]"));
  EXPECT_TRUE(error_.ok());

  Evaluate(Index(0, false), "{\"a\":1}");
  EXPECT_EQ(ErrorCode::kTypeMismatch, error_.code());
  EXPECT_EQ("Cannot index object with number", error_.message());

  EXPECT_THAT(Evaluate(Index(0, true), "{\"a\":1}"), EqualsJsonList("[]"));
  EXPECT_TRUE(error_.ok());
  EXPECT_EQ("Index(-1)", Index(-1, false).DebugString());
}

TEST_F(AccessTest, IndexPaths) {
  Index index(-1, false);
  std::vector<PathValue> paths =
      CollectPaths(index, "[1,2,3]", PathMode::kExisting);
  ASSERT_TRUE(collected_);
  ASSERT_EQ(1u, paths.size());
  // Negative indices are resolved.
  EXPECT_THAT(PathToValue(paths[0].path), EqualsJson("[2]"));

  paths = CollectPaths(Index(4, false), "[1]", PathMode::kExisting);
  EXPECT_FALSE(collected_);
  EXPECT_EQ(ErrorCode::kPathNotFound, error_.code());

  paths = CollectPaths(Index(4, false), "[1]", PathMode::kCreate);
  ASSERT_TRUE(collected_);
  ASSERT_EQ(1u, paths.size());
  EXPECT_THAT(PathToValue(paths[0].path), EqualsJson("[4]"));
}

TEST_F(AccessTest, Slice) {
  EXPECT_THAT(Evaluate(Slice(true, 1, true, 3, false), "[0,1,2,3,4]"),
              EqualsJsonList("[[1,2]]"));
  EXPECT_THAT(Evaluate(Slice(false, 0, true, 2, false), "[0,1,2]"),
              EqualsJsonList("[[0,1]]"));
  EXPECT_THAT(Evaluate(Slice(true, -2, false, 0, false), "[0,1,2]"),
              EqualsJsonList("[[1,2]]"));
  EXPECT_THAT(Evaluate(Slice(true, 2, true, 100, false), "[0,1,2]"),
              EqualsJsonList("[[2]]"));
  EXPECT_THAT(Evaluate(Slice(true, 3, true, 1, false), "[0,1,2]"),
              EqualsJsonList("[[]]"));
  EXPECT_THAT(Evaluate(Slice(true, 0, true, 1, false), "null"),
              EqualsJsonList("[null]"));

  Evaluate(Slice(true, 0, true, 1, false), "{}");
  EXPECT_EQ("Cannot slice object", error_.message());
  EXPECT_EQ("Slice(1, null)", Slice(true, 1, false, 0, false).DebugString());
}

TEST_F(AccessTest, SliceIsNotAPathExpression) {
  CollectPaths(Slice(true, 0, true, 1, false), "[1]", PathMode::kCreate);
  EXPECT_FALSE(collected_);
  EXPECT_EQ(ErrorCode::kTypeMismatch, error_.code());
  EXPECT_EQ("Invalid path expression: Slice(0, 1)", error_.message());
}

}  // namespace
}  // namespace model
}  // namespace jq_path
