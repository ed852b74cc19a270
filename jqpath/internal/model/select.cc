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

#include "jqpath/internal/model/select.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "jqpath/internal/streams.h"

namespace jq_path {
namespace model {

bool MatchesPredicate(const Node& predicate, const Value& input, bool* truthy,
                      QueryError* error) {
  *truthy = false;
  std::unique_ptr<ResultStream> outputs = predicate.Evaluate(input);
  Value output;
  while (outputs->Next(&output)) {
    if (output.Truthy()) {
      *truthy = true;
      return true;
    }
  }
  if (!outputs->ok()) {
    *error = outputs->error();
    return false;
  }
  return true;
}

Select::Select(std::unique_ptr<const Node> predicate)
    : predicate_(std::move(predicate)) {}

// override
std::unique_ptr<ResultStream> Select::Evaluate(const Value& input) const {
  bool selected = false;
  QueryError error;
  if (!MatchesPredicate(*predicate_, input, &selected, &error)) {
    return ErrorStream(error);
  }
  return selected ? SingleValueStream(input) : EmptyStream();
}

// override
bool Select::CollectPaths(const PathValue& input, PathMode mode,
                          std::vector<PathValue>* paths,
                          QueryError* error) const {
  bool selected = false;
  if (!MatchesPredicate(*predicate_, input.value, &selected, error)) {
    return false;
  }
  if (selected) paths->push_back(input);
  return true;
}

// override
string Select::DebugString() const {
  return absl::StrCat("Select(", predicate_->DebugString(), ")");
}

}  // namespace model
}  // namespace jq_path
