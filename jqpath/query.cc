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

#include "jqpath/query.h"

#include <utility>

#include <glog/logging.h>

#include "absl/memory/memory.h"
#include "json/json.h"
#include "jqpath/internal/parser.h"
#include "jqpath/json_utils.h"
#include "jqpath/logging.h"

namespace jq_path {

Query::Query(const string& expression, std::unique_ptr<const model::Node> root)
    : expression_(expression), root_(std::move(root)) {}

// static
std::unique_ptr<Query> Query::Create(const string& expression,
                                     QueryError* error) {
  return Create(expression, FunctionRegistry::Default(), error);
}

// static
std::unique_ptr<Query> Query::Create(const string& expression,
                                     const FunctionRegistry& registry,
                                     QueryError* error) {
  RETURN_NULL_IF(error == nullptr);
  internal::Parser parser(&registry);
  std::unique_ptr<const model::Node> root = parser.Parse(expression, error);
  if (root == nullptr) {
    VLOG(1) << "Cannot parse '" << expression << "': " << *error;
    return nullptr;
  }
  return absl::WrapUnique(new Query(expression, std::move(root)));
}

std::unique_ptr<ResultStream> Query::Evaluate(const Value& input) const {
  return root_->Evaluate(input);
}

bool Evaluate(const string& expression, const Value& input,
              std::vector<Value>* results, QueryError* error) {
  RETURN_FALSE_IF(results == nullptr);
  RETURN_FALSE_IF(error == nullptr);
  std::unique_ptr<Query> query = Query::Create(expression, error);
  if (query == nullptr) return false;
  std::unique_ptr<ResultStream> stream = query->Evaluate(input);
  return DrainStream(stream.get(), results, error);
}

bool Evaluate(const string& expression, const Json::Value& input,
              std::vector<Json::Value>* results, QueryError* error) {
  RETURN_FALSE_IF(results == nullptr);
  std::vector<Value> values;
  const bool ok =
      Evaluate(expression, json_utils::FromJsonCpp(input), &values, error);
  for (const Value& value : values) {
    results->push_back(json_utils::ToJsonCpp(value));
  }
  return ok;
}

}  // namespace jq_path
