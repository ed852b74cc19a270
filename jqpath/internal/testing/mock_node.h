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

#ifndef JQ_PATH_INTERNAL_TESTING_MOCK_NODE_H_
#define JQ_PATH_INTERNAL_TESTING_MOCK_NODE_H_

#include "jqpath/internal/model/node.h"

#include <memory>
#include <string>

#include <gmock/gmock.h>

#include "jqpath/internal/streams.h"

namespace jq_path {

// By default behaves like the identity filter.
class MockNode : public model::Node {
 public:
  MockNode() {
    using ::testing::_;
    using ::testing::Invoke;
    using ::testing::Return;
    ON_CALL(*this, Evaluate(_))
        .WillByDefault(Invoke([](const Value& input) {
          return SingleValueStream(input);
        }));
    ON_CALL(*this, DebugString()).WillByDefault(Return("Mock"));
  }
  MockNode(const MockNode&) = delete;
  MockNode& operator=(const MockNode&) = delete;
  ~MockNode() override = default;

  MOCK_CONST_METHOD1(Evaluate, std::unique_ptr<ResultStream>(const Value&));
  MOCK_CONST_METHOD0(DebugString, string());
};

}  // namespace jq_path

#endif  // JQ_PATH_INTERNAL_TESTING_MOCK_NODE_H_
