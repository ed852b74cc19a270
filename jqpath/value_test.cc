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

#include "jqpath/value.h"

#include <limits>
#include <vector>

#include <gtest/gtest.h>

#include "jqpath/platform/test_util.h"

namespace jq_path {
namespace {

TEST(ValueTest, Types) {
  EXPECT_TRUE(Value().IsNull());
  EXPECT_TRUE(Value(true).IsBoolean());
  EXPECT_TRUE(Value(1).IsInteger());
  EXPECT_FALSE(Value(1.5).IsInteger());
  EXPECT_TRUE(Value(1.5).IsNumber());
  EXPECT_TRUE(Value("a").IsString());
  EXPECT_TRUE(Value::EmptyArray().IsArray());
  EXPECT_TRUE(Value::EmptyObject().IsObject());

  EXPECT_STREQ("null", Value().TypeName());
  EXPECT_STREQ("boolean", Value(false).TypeName());
  EXPECT_STREQ("number", Value(2).TypeName());
  EXPECT_STREQ("string", Value("x").TypeName());
  EXPECT_STREQ("array", Value::EmptyArray().TypeName());
  EXPECT_STREQ("object", Value::EmptyObject().TypeName());
}

TEST(ValueTest, LargeUnsignedNumbers) {
  const Value small(static_cast<uint64>(7));
  EXPECT_EQ(Value::kInt64, small.number_kind());
  EXPECT_EQ(7, small.AsInt64());

  const Value big(std::numeric_limits<uint64>::max());
  EXPECT_EQ(Value::kUInt64, big.number_kind());
  EXPECT_EQ(std::numeric_limits<uint64>::max(), big.AsUInt64());
  EXPECT_GT(big.Compare(Value(std::numeric_limits<int64>::max())), 0);
}

TEST(ValueTest, Truthy) {
  EXPECT_FALSE(Value().Truthy());
  EXPECT_FALSE(Value(false).Truthy());
  EXPECT_TRUE(Value(true).Truthy());
  EXPECT_TRUE(Value(0).Truthy());
  EXPECT_TRUE(Value("").Truthy());
  EXPECT_TRUE(Value::EmptyArray().Truthy());
  EXPECT_TRUE(Value::EmptyObject().Truthy());
}

TEST(ValueTest, OrderAcrossTypes) {
  const std::vector<Value> ordered = {
      Value(),           Value(false), Value(true),
      Value(-1),         Value(0.5),   Value(2),
      Value(""),         Value("a"),   ParseJsonOrDie("[]"),
      ParseJsonOrDie("[1]"), ParseJsonOrDie("{}"),
      ParseJsonOrDie("{\"a\":1}")};
  for (size_t i = 0; i + 1 < ordered.size(); ++i) {
    EXPECT_LT(ordered[i].Compare(ordered[i + 1]), 0)
        << ordered[i] << " vs " << ordered[i + 1];
    EXPECT_GT(ordered[i + 1].Compare(ordered[i]), 0);
  }
}

TEST(ValueTest, IntegerAndDoubleCompareByValue) {
  EXPECT_EQ(Value(1), Value(1.0));
  EXPECT_LT(Value(1), Value(1.5));
}

TEST(ValueTest, ObjectsCompareByKeysThenValues) {
  EXPECT_EQ(ParseJsonOrDie("{\"a\":1,\"b\":2}"),
            ParseJsonOrDie("{\"b\":2,\"a\":1}"));
  // Key sets are compared first.
  EXPECT_LT(ParseJsonOrDie("{\"a\":9}"), ParseJsonOrDie("{\"b\":0}"));
  EXPECT_LT(ParseJsonOrDie("{\"a\":1}"), ParseJsonOrDie("{\"a\":2}"));
  EXPECT_LT(ParseJsonOrDie("{\"a\":1}"), ParseJsonOrDie("{\"a\":1,\"b\":0}"));
}

TEST(ValueTest, ObjectKeepsInsertionOrder) {
  Object object;
  object.Set("z", Value(1));
  object.Set("a", Value(2));
  object.Set("z", Value(3));
  ASSERT_EQ(2u, object.size());
  EXPECT_EQ("z", object.at(0).first);
  EXPECT_EQ(Value(3), object.at(0).second);
  EXPECT_EQ("a", object.at(1).first);

  EXPECT_TRUE(object.Erase("z"));
  EXPECT_FALSE(object.Erase("z"));
  EXPECT_EQ(nullptr, object.Find("z"));
  ASSERT_NE(nullptr, object.Find("a"));
  EXPECT_EQ(Value(2), *object.Find("a"));
}

TEST(ValueTest, CopyOnWrite) {
  Value original = ParseJsonOrDie("{\"a\":[1,2]}");
  Value copy = original;
  copy.MutableObject()->Set("b", Value(true));
  EXPECT_THAT(original, testing::EqualsJson("{\"a\":[1,2]}"));
  EXPECT_THAT(copy, testing::EqualsJson("{\"a\":[1,2],\"b\":true}"));

  Value nested = *original.AsObject().Find("a");
  nested.MutableArray()->push_back(Value(3));
  EXPECT_THAT(original, testing::EqualsJson("{\"a\":[1,2]}"));
  EXPECT_EQ(3u, nested.size());
}

TEST(ValueTest, MutableAccessorsOnScalars) {
  Value scalar(1);
  EXPECT_EQ(nullptr, scalar.MutableArray());
  EXPECT_EQ(nullptr, scalar.MutableObject());
}

TEST(ValueTest, Swap) {
  Value a("text");
  Value b = ParseJsonOrDie("[1]");
  a.Swap(&b);
  EXPECT_THAT(a, testing::EqualsJson("[1]"));
  EXPECT_EQ(Value("text"), b);
}

TEST(ValueTest, DebugString) {
  EXPECT_EQ("{\"a\":[1,null,\"x\"]}",
            ParseJsonOrDie("{ \"a\" : [1, null, \"x\"] }").DebugString());
}

}  // namespace
}  // namespace jq_path
