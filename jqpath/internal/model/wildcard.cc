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

#include "jqpath/internal/model/wildcard.h"

#include <utility>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "jqpath/internal/streams.h"

namespace jq_path {
namespace model {

namespace {

QueryError CannotIterate(const Value& input) {
  return QueryError::TypeMismatch(
      absl::StrCat("Cannot iterate over ", input.TypeName()));
}

}  // namespace

Wildcard::Wildcard(bool optional) : optional_(optional) {}

// override
std::unique_ptr<ResultStream> Wildcard::Evaluate(const Value& input) const {
  if (!input.IsArray() && !input.IsObject()) {
    if (optional_) return EmptyStream();
    return ErrorStream(CannotIterate(input));
  }
  return absl::make_unique<ElementStream>(input);
}

// override
bool Wildcard::CollectPaths(const PathValue& input, PathMode mode,
                            std::vector<PathValue>* paths,
                            QueryError* error) const {
  if (input.value.IsArray()) {
    const Array& array = input.value.AsArray();
    for (size_t i = 0; i < array.size(); ++i) {
      PathValue element;
      element.path = input.path;
      element.path.push_back(PathElement::Index(static_cast<int64>(i)));
      element.value = array[i];
      paths->push_back(std::move(element));
    }
    return true;
  }
  if (input.value.IsObject()) {
    for (const auto& member : input.value.AsObject()) {
      PathValue element;
      element.path = input.path;
      element.path.push_back(PathElement::Key(member.first));
      element.value = member.second;
      paths->push_back(std::move(element));
    }
    return true;
  }
  // A location that does not exist yet has nothing to iterate.
  if (input.value.IsNull() && mode == PathMode::kCreate) return true;
  if (optional_) return true;
  *error = CannotIterate(input.value);
  return false;
}

// override
string Wildcard::DebugString() const {
  return optional_ ? "Wildcard?" : "Wildcard";
}

}  // namespace model
}  // namespace jq_path
