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

#include "jqpath/internal/model/composition.h"

#include <utility>

#include <glog/logging.h>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "jqpath/internal/streams.h"

namespace jq_path {
namespace model {

Pipe::Pipe(std::unique_ptr<const Node> left, std::unique_ptr<const Node> right)
    : left_(std::move(left)), right_(std::move(right)) {}

// override
std::unique_ptr<ResultStream> Pipe::Evaluate(const Value& input) const {
  return absl::make_unique<PipeStream>(left_->Evaluate(input), right_.get());
}

// override
bool Pipe::CollectPaths(const PathValue& input, PathMode mode,
                        std::vector<PathValue>* paths,
                        QueryError* error) const {
  std::vector<PathValue> intermediate;
  if (!left_->CollectPaths(input, mode, &intermediate, error)) return false;
  for (const PathValue& location : intermediate) {
    if (!right_->CollectPaths(location, mode, paths, error)) return false;
  }
  return true;
}

// override
string Pipe::DebugString() const {
  return absl::StrCat("Pipe(", left_->DebugString(), ", ",
                      right_->DebugString(), ")");
}

//------------------------------------------------------------------------------

Comma::Comma(NodeList branches) : branches_(std::move(branches)) {
  DCHECK_GE(branches_.size(), 2u);
}

// override
std::unique_ptr<ResultStream> Comma::Evaluate(const Value& input) const {
  std::vector<const Node*> nodes;
  nodes.reserve(branches_.size());
  for (const auto& branch : branches_) {
    nodes.push_back(branch.get());
  }
  return absl::make_unique<ConcatStream>(std::move(nodes), input);
}

// override
bool Comma::CollectPaths(const PathValue& input, PathMode mode,
                         std::vector<PathValue>* paths,
                         QueryError* error) const {
  for (const auto& branch : branches_) {
    if (!branch->CollectPaths(input, mode, paths, error)) return false;
  }
  return true;
}

// override
string Comma::DebugString() const {
  return absl::StrCat(
      "Comma(",
      absl::StrJoin(branches_, ", ",
                    [](string* out, const std::unique_ptr<const Node>& node) {
                      out->append(node->DebugString());
                    }),
      ")");
}

//------------------------------------------------------------------------------

Optional::Optional(std::unique_ptr<const Node> term) : term_(std::move(term)) {}

// override
std::unique_ptr<ResultStream> Optional::Evaluate(const Value& input) const {
  return absl::make_unique<OptionalStream>(term_->Evaluate(input));
}

// override
bool Optional::CollectPaths(const PathValue& input, PathMode mode,
                            std::vector<PathValue>* paths,
                            QueryError* error) const {
  // Locations found before a failure are kept, the failure is dropped.
  QueryError suppressed;
  if (!term_->CollectPaths(input, mode, paths, &suppressed)) {
    VLOG(2) << "Suppressed error: " << suppressed;
  }
  return true;
}

// override
string Optional::DebugString() const {
  return absl::StrCat("Optional(", term_->DebugString(), ")");
}

}  // namespace model
}  // namespace jq_path
