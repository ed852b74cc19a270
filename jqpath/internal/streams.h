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

// The ResultStream implementations the expression nodes are built from.

#ifndef JQ_PATH_INTERNAL_STREAMS_H_
#define JQ_PATH_INTERNAL_STREAMS_H_

#include <memory>
#include <vector>

#include "jqpath/error.h"
#include "jqpath/internal/model/node.h"
#include "jqpath/result_stream.h"
#include "jqpath/value.h"

namespace jq_path {

// Yields a fixed list of values, then ends with 'error' if it is not ok.
class ValueListStream : public ResultStream {
 public:
  explicit ValueListStream(std::vector<Value> values);
  ValueListStream(std::vector<Value> values, const QueryError& error);
  ~ValueListStream() override = default;

  bool Next(Value* result) override;

 private:
  std::vector<Value> values_;
  size_t next_ = 0;
  const QueryError trailing_error_;
};

std::unique_ptr<ResultStream> EmptyStream();
std::unique_ptr<ResultStream> SingleValueStream(Value value);
std::unique_ptr<ResultStream> ErrorStream(const QueryError& error);

// Yields the elements of an array or the member values of an object in
// insertion order.
class ElementStream : public ResultStream {
 public:
  // 'container' must be an array or an object.
  explicit ElementStream(const Value& container);
  ~ElementStream() override = default;

  bool Next(Value* result) override;

 private:
  const Value container_;
  size_t next_ = 0;
};

// For every value of 'left', yields all outputs of 'right' evaluated against
// that value. 'right' is only evaluated when the consumer pulls, so abandoning
// the stream stops the work on both sides.
class PipeStream : public ResultStream {
 public:
  // Does not take ownership of 'right'.
  PipeStream(std::unique_ptr<ResultStream> left, const model::Node* right);
  ~PipeStream() override = default;

  bool Next(Value* result) override;

 private:
  std::unique_ptr<ResultStream> left_;
  const model::Node* const right_;
  std::unique_ptr<ResultStream> current_;
  bool done_ = false;
};

// Yields the outputs of each node in 'nodes' against 'input', one node after
// the other. An error ends the whole stream.
class ConcatStream : public ResultStream {
 public:
  // Does not take ownership of the nodes.
  ConcatStream(std::vector<const model::Node*> nodes, const Value& input);
  ~ConcatStream() override = default;

  bool Next(Value* result) override;

 private:
  const std::vector<const model::Node*> nodes_;
  const Value input_;
  size_t next_node_ = 0;
  std::unique_ptr<ResultStream> current_;
  bool done_ = false;
};

// Forwards the values of 'inner' and ends silently, without an error, when
// 'inner' fails.
class OptionalStream : public ResultStream {
 public:
  explicit OptionalStream(std::unique_ptr<ResultStream> inner);
  ~OptionalStream() override = default;

  bool Next(Value* result) override;

 private:
  std::unique_ptr<ResultStream> inner_;
  bool done_ = false;
};

}  // namespace jq_path

#endif  // JQ_PATH_INTERNAL_STREAMS_H_
