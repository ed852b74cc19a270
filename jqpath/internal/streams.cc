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

#include "jqpath/internal/streams.h"

#include <utility>

#include <glog/logging.h>

#include "absl/memory/memory.h"

namespace jq_path {

ValueListStream::ValueListStream(std::vector<Value> values)
    : values_(std::move(values)) {}

ValueListStream::ValueListStream(std::vector<Value> values,
                                 const QueryError& error)
    : values_(std::move(values)), trailing_error_(error) {}

// override
bool ValueListStream::Next(Value* result) {
  if (next_ < values_.size()) {
    *result = std::move(values_[next_++]);
    return true;
  }
  if (!trailing_error_.ok()) return Fail(trailing_error_);
  return false;
}

std::unique_ptr<ResultStream> EmptyStream() {
  return absl::make_unique<ValueListStream>(std::vector<Value>());
}

std::unique_ptr<ResultStream> SingleValueStream(Value value) {
  std::vector<Value> values;
  values.push_back(std::move(value));
  return absl::make_unique<ValueListStream>(std::move(values));
}

std::unique_ptr<ResultStream> ErrorStream(const QueryError& error) {
  return absl::make_unique<ValueListStream>(std::vector<Value>(), error);
}

//------------------------------------------------------------------------------

ElementStream::ElementStream(const Value& container) : container_(container) {
  DCHECK(container_.IsArray() || container_.IsObject())
      << "ElementStream over " << container_.TypeName();
}

// override
bool ElementStream::Next(Value* result) {
  if (next_ >= container_.size()) return false;
  if (container_.IsArray()) {
    *result = container_.AsArray()[next_++];
  } else {
    *result = container_.AsObject().at(next_++).second;
  }
  return true;
}

//------------------------------------------------------------------------------

PipeStream::PipeStream(std::unique_ptr<ResultStream> left,
                       const model::Node* right)
    : left_(std::move(left)), right_(right) {}

// override
bool PipeStream::Next(Value* result) {
  while (!done_) {
    if (current_ != nullptr) {
      if (current_->Next(result)) return true;
      if (!current_->ok()) {
        done_ = true;
        return Fail(current_->error());
      }
      current_.reset();
    }
    Value upstream;
    if (!left_->Next(&upstream)) {
      done_ = true;
      if (!left_->ok()) return Fail(left_->error());
      return false;
    }
    current_ = right_->Evaluate(upstream);
  }
  return false;
}

//------------------------------------------------------------------------------

ConcatStream::ConcatStream(std::vector<const model::Node*> nodes,
                           const Value& input)
    : nodes_(std::move(nodes)), input_(input) {}

// override
bool ConcatStream::Next(Value* result) {
  while (!done_) {
    if (current_ == nullptr) {
      if (next_node_ >= nodes_.size()) {
        done_ = true;
        return false;
      }
      current_ = nodes_[next_node_++]->Evaluate(input_);
    }
    if (current_->Next(result)) return true;
    if (!current_->ok()) {
      done_ = true;
      return Fail(current_->error());
    }
    current_.reset();
  }
  return false;
}

//------------------------------------------------------------------------------

OptionalStream::OptionalStream(std::unique_ptr<ResultStream> inner)
    : inner_(std::move(inner)) {}

// override
bool OptionalStream::Next(Value* result) {
  if (done_) return false;
  if (inner_->Next(result)) return true;
  done_ = true;
  if (!inner_->ok()) {
    VLOG(2) << "Suppressed error: " << inner_->error();
  }
  return false;
}

}  // namespace jq_path
