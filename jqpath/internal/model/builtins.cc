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

#include "jqpath/internal/model/builtins.h"

#include <utility>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "jqpath/internal/model/select.h"
#include "jqpath/internal/streams.h"

namespace jq_path {
namespace model {

namespace {

const char* TypeFilterName(TypeFilter::Kind kind) {
  switch (kind) {
    case TypeFilter::kArrays:
      return "arrays";
    case TypeFilter::kObjects:
      return "objects";
    case TypeFilter::kIterables:
      return "iterables";
    case TypeFilter::kScalars:
      return "scalars";
    case TypeFilter::kBooleans:
      return "booleans";
    case TypeFilter::kNumbers:
      return "numbers";
    case TypeFilter::kStrings:
      return "strings";
    case TypeFilter::kNulls:
      return "nulls";
    case TypeFilter::kValues:
      return "values";
  }
  return "unknown";
}

// Appends the path of every value strictly below 'value' to 'paths', each
// container before its children. 'prefix' is the path of 'value'.
bool WalkPaths(const Value& value, Path* prefix, const Node* filter,
               std::vector<Value>* paths, QueryError* error) {
  auto visit = [prefix, filter, paths, error](const Value& child) {
    bool keep = true;
    if (filter != nullptr &&
        !MatchesPredicate(*filter, child, &keep, error)) {
      return false;
    }
    if (keep) paths->push_back(PathToValue(*prefix));
    return WalkPaths(child, prefix, filter, paths, error);
  };

  if (value.IsArray()) {
    const Array& array = value.AsArray();
    for (size_t i = 0; i < array.size(); ++i) {
      prefix->push_back(PathElement::Index(static_cast<int64>(i)));
      const bool ok = visit(array[i]);
      prefix->pop_back();
      if (!ok) return false;
    }
  } else if (value.IsObject()) {
    for (const auto& member : value.AsObject()) {
      prefix->push_back(PathElement::Key(member.first));
      const bool ok = visit(member.second);
      prefix->pop_back();
      if (!ok) return false;
    }
  }
  return true;
}

}  // namespace

// override
std::unique_ptr<ResultStream> Empty::Evaluate(const Value& input) const {
  return EmptyStream();
}

// override
bool Empty::CollectPaths(const PathValue& input, PathMode mode,
                         std::vector<PathValue>* paths,
                         QueryError* error) const {
  return true;
}

//------------------------------------------------------------------------------

// override
std::unique_ptr<ResultStream> Not::Evaluate(const Value& input) const {
  return SingleValueStream(Value(!input.Truthy()));
}

//------------------------------------------------------------------------------

TypeFilter::TypeFilter(Kind kind) : kind_(kind) {}

bool TypeFilter::Matches(const Value& value) const {
  switch (kind_) {
    case kArrays:
      return value.IsArray();
    case kObjects:
      return value.IsObject();
    case kIterables:
      return value.IsArray() || value.IsObject();
    case kScalars:
      return !value.IsArray() && !value.IsObject();
    case kBooleans:
      return value.IsBoolean();
    case kNumbers:
      return value.IsNumber();
    case kStrings:
      return value.IsString();
    case kNulls:
      return value.IsNull();
    case kValues:
      return !value.IsNull();
  }
  return false;
}

// override
std::unique_ptr<ResultStream> TypeFilter::Evaluate(const Value& input) const {
  return Matches(input) ? SingleValueStream(input) : EmptyStream();
}

// override
bool TypeFilter::CollectPaths(const PathValue& input, PathMode mode,
                              std::vector<PathValue>* paths,
                              QueryError* error) const {
  if (Matches(input.value)) paths->push_back(input);
  return true;
}

// override
string TypeFilter::DebugString() const {
  return absl::StrCat("TypeFilter(", TypeFilterName(kind_), ")");
}

//------------------------------------------------------------------------------

Paths::Paths(std::unique_ptr<const Node> filter) : filter_(std::move(filter)) {}

// override
std::unique_ptr<ResultStream> Paths::Evaluate(const Value& input) const {
  std::vector<Value> paths;
  Path prefix;
  QueryError error;
  if (!WalkPaths(input, &prefix, filter_.get(), &paths, &error)) {
    return absl::make_unique<ValueListStream>(std::move(paths), error);
  }
  return absl::make_unique<ValueListStream>(std::move(paths));
}

// override
string Paths::DebugString() const {
  if (filter_ == nullptr) return "Paths";
  return absl::StrCat("Paths(", filter_->DebugString(), ")");
}

//------------------------------------------------------------------------------

Delete::Delete(std::unique_ptr<const Node> locations)
    : locations_(std::move(locations)) {}

// override
std::unique_ptr<ResultStream> Delete::Evaluate(const Value& input) const {
  PathValue root;
  root.value = input;
  std::vector<PathValue> found;
  QueryError error;
  if (!locations_->CollectPaths(root, PathMode::kCreate, &found, &error)) {
    return ErrorStream(error);
  }
  std::vector<Path> paths;
  paths.reserve(found.size());
  for (PathValue& location : found) {
    paths.push_back(std::move(location.path));
  }
  Value result = input;
  if (!DeleteAtPaths(std::move(paths), &result, &error)) {
    return ErrorStream(error);
  }
  return SingleValueStream(std::move(result));
}

// override
string Delete::DebugString() const {
  return absl::StrCat("Delete(", locations_->DebugString(), ")");
}

}  // namespace model
}  // namespace jq_path
