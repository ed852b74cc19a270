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

// Entry points for looking up, testing and updating the locations a query
// addresses.

#ifndef JQ_PATH_OPERATIONS_H_
#define JQ_PATH_OPERATIONS_H_

#include <memory>
#include <vector>

#include "jqpath/error.h"
#include "jqpath/path.h"
#include "jqpath/query.h"
#include "jqpath/result_stream.h"
#include "jqpath/value.h"

namespace jq_path {

// The lazy outputs of 'query' for 'input'. Same as query.Evaluate(input).
std::unique_ptr<ResultStream> GetPath(const Query& query, const Value& input);

// Collects every output in order. Returns false and sets 'error' if evaluation
// fails; outputs produced before the failure are kept in 'results'.
bool Batch(const Query& query, const Value& input, std::vector<Value>* results,
           QueryError* error);

// True iff evaluation produces at least one output before any error. Stops
// evaluating after the first output.
bool HasPath(const Query& query, const Value& input);

// Stores the first output in 'result'. Returns false with kNotFound in 'error'
// if there is no output, or with the evaluation error if one occurred first.
bool First(const Query& query, const Value& input, Value* result,
           QueryError* error);

enum class SetMode {
  // Missing object members are created and arrays padded with nulls, as
  // jq's setpath does. A query addressing no location leaves the input
  // unchanged.
  kCreateMissing = 0,
  // Every addressed location must already exist; a missing one fails with
  // kPathNotFound and nothing is changed.
  kStrict,
};

// Stores in 'result' a copy of 'input' where every location addressed by
// 'query' holds 'new_value'. 'input' itself is not modified. The query must be
// a path expression (accessors, wildcards, select, pipes and commas);
// anything else fails with kTypeMismatch.
bool SetPath(const Query& query, const Value& input, const Value& new_value,
             SetMode mode, Value* result, QueryError* error);

// Stores in 'result' a copy of 'input' without the locations addressed by
// 'query'. Locations that do not exist are ignored.
bool DeletePath(const Query& query, const Value& input, Value* result,
                QueryError* error);

// The concrete locations addressed by 'query' in 'input', in output order.
// Missing members and elements are reported as well.
bool GetPaths(const Query& query, const Value& input, std::vector<Path>* paths,
              QueryError* error);

}  // namespace jq_path

#endif  // JQ_PATH_OPERATIONS_H_
