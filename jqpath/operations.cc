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

#include "jqpath/operations.h"

#include <utility>

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "jqpath/internal/model/node.h"
#include "jqpath/logging.h"

namespace jq_path {

namespace {

bool CollectLocations(const Query& query, const Value& input,
                      model::PathMode mode, std::vector<Path>* paths,
                      QueryError* error) {
  model::PathValue root;
  root.value = input;
  std::vector<model::PathValue> found;
  if (!query.root().CollectPaths(root, mode, &found, error)) return false;
  for (model::PathValue& location : found) {
    paths->push_back(std::move(location.path));
  }
  return true;
}

}  // namespace

std::unique_ptr<ResultStream> GetPath(const Query& query, const Value& input) {
  return query.Evaluate(input);
}

bool Batch(const Query& query, const Value& input, std::vector<Value>* results,
           QueryError* error) {
  RETURN_FALSE_IF(results == nullptr);
  RETURN_FALSE_IF(error == nullptr);
  std::unique_ptr<ResultStream> stream = query.Evaluate(input);
  return DrainStream(stream.get(), results, error);
}

bool HasPath(const Query& query, const Value& input) {
  std::unique_ptr<ResultStream> stream = query.Evaluate(input);
  Value ignored;
  return stream->Next(&ignored);
}

bool First(const Query& query, const Value& input, Value* result,
           QueryError* error) {
  RETURN_FALSE_IF(result == nullptr);
  RETURN_FALSE_IF(error == nullptr);
  std::unique_ptr<ResultStream> stream = query.Evaluate(input);
  if (stream->Next(result)) return true;
  *error = stream->ok() ? QueryError::NotFound() : stream->error();
  return false;
}

bool SetPath(const Query& query, const Value& input, const Value& new_value,
             SetMode mode, Value* result, QueryError* error) {
  RETURN_FALSE_IF(result == nullptr);
  RETURN_FALSE_IF(error == nullptr);
  std::vector<Path> paths;
  const model::PathMode path_mode = mode == SetMode::kStrict
                                        ? model::PathMode::kExisting
                                        : model::PathMode::kCreate;
  if (!CollectLocations(query, input, path_mode, &paths, error)) return false;
  if (paths.empty() && mode == SetMode::kStrict) {
    *error = QueryError::PathNotFound(
        absl::StrCat("No location matches ", query.expression()));
    return false;
  }
  VLOG(1) << "Setting " << paths.size() << " location(s) of "
          << query.expression();

  Value updated = input;
  for (const Path& path : paths) {
    if (!SetAtPath(path, new_value, &updated, error)) return false;
  }
  result->Swap(&updated);
  return true;
}

bool DeletePath(const Query& query, const Value& input, Value* result,
                QueryError* error) {
  RETURN_FALSE_IF(result == nullptr);
  RETURN_FALSE_IF(error == nullptr);
  std::vector<Path> paths;
  if (!CollectLocations(query, input, model::PathMode::kCreate, &paths,
                        error)) {
    return false;
  }
  Value updated = input;
  if (!DeleteAtPaths(std::move(paths), &updated, error)) return false;
  result->Swap(&updated);
  return true;
}

bool GetPaths(const Query& query, const Value& input, std::vector<Path>* paths,
              QueryError* error) {
  RETURN_FALSE_IF(paths == nullptr);
  RETURN_FALSE_IF(error == nullptr);
  return CollectLocations(query, input, model::PathMode::kCreate, paths, error);
}

}  // namespace jq_path
