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

#ifndef JQ_PATH_QUERY_H_
#define JQ_PATH_QUERY_H_

#include <memory>
#include <string>
#include <vector>

#include "jqpath/error.h"
#include "jqpath/function_registry.h"
#include "jqpath/internal/model/node.h"
#include "jqpath/platform/types.h"
#include "jqpath/result_stream.h"
#include "jqpath/value.h"

namespace Json { class Value; }

namespace jq_path {

// A parsed filter expression. A Query is immutable and may be evaluated
// against any number of inputs, concurrently from several threads.
//
// Sample use:
//   QueryError error;
//   auto query = Query::Create(".[] | select(.active == true)", &error);
//   if (query == nullptr) LOG(ERROR) << error;
//   std::unique_ptr<ResultStream> results = query->Evaluate(input);
class Query {
 public:
  Query(const Query&) = delete;
  Query& operator=(const Query&) = delete;
  ~Query() = default;

  // Parses 'expression' with the built-in functions. Returns nullptr and sets
  // a kSyntaxError in 'error' if the expression is malformed.
  static std::unique_ptr<Query> Create(const string& expression,
                                       QueryError* error);

  // Same as above, resolving function calls against 'registry'. The registry
  // is only used while parsing.
  static std::unique_ptr<Query> Create(const string& expression,
                                       const FunctionRegistry& registry,
                                       QueryError* error);

  // Starts a new lazy evaluation against 'input'. Each call is independent of
  // earlier ones. The returned stream must not outlive this query.
  std::unique_ptr<ResultStream> Evaluate(const Value& input) const;

  // If the whole expression is a constant (a number, string, true, false or
  // null) returns that constant, nullptr otherwise.
  const Value* AsLiteral() const { return root_->AsLiteral(); }
  bool IsLiteral() const { return AsLiteral() != nullptr; }

  const string& expression() const { return expression_; }
  const model::Node& root() const { return *root_; }

  // The structure of the parsed tree, e.g. Pipe(Key("a"), Wildcard).
  string DebugString() const { return root_->DebugString(); }

 private:
  Query(const string& expression, std::unique_ptr<const model::Node> root);

  const string expression_;
  const std::unique_ptr<const model::Node> root_;
};

// Parses 'expression' and collects all of its outputs for 'input' into
// 'results'. Returns false and sets 'error' on a syntax or evaluation error;
// outputs produced before an evaluation error are kept in 'results'.
bool Evaluate(const string& expression, const Value& input,
              std::vector<Value>* results, QueryError* error);

// The same for hosts holding jsoncpp documents. Members of objects produced by
// the query come out in jsoncpp's key order.
bool Evaluate(const string& expression, const Json::Value& input,
              std::vector<Json::Value>* results, QueryError* error);

}  // namespace jq_path

#endif  // JQ_PATH_QUERY_H_
