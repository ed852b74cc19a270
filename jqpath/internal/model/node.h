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

// IWYU pragma: private, include "jqpath/internal/model/model.h"
// IWYU pragma: friend jqpath/internal/model/*

#ifndef JQ_PATH_INTERNAL_MODEL_NODE_H_
#define JQ_PATH_INTERNAL_MODEL_NODE_H_

#include <memory>
#include <string>
#include <vector>

#include "jqpath/error.h"
#include "jqpath/path.h"
#include "jqpath/platform/types.h"
#include "jqpath/result_stream.h"
#include "jqpath/value.h"

namespace jq_path {
namespace model {

// A location inside the document being queried together with the value
// found there (null for locations that do not exist yet).
struct PathValue {
  Path path;
  Value value;
};

// How missing locations are treated while collecting paths.
enum class PathMode {
  // A missing key or index is a kPathNotFound error. Used by strict updates.
  kExisting = 0,
  // A missing key or index is reported with a null value, as jq's path(f)
  // does. Used by deletion and lenient updates.
  kCreate,
};

// A node of a parsed filter expression. Trees of nodes are immutable once
// built and may be evaluated any number of times, from any number of threads.
class Node {
 public:
  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;
  virtual ~Node() = default;

  // Returns a lazy stream of the outputs of this node for 'input'. The stream
  // refers to this node, which must outlive it. Never returns nullptr.
  virtual std::unique_ptr<ResultStream> Evaluate(const Value& input) const = 0;

  // Appends to 'paths' every location this node addresses when applied to the
  // value at 'input'; the appended paths extend 'input.path'. Returns false and
  // sets 'error' if a step fails. Nodes that do not describe locations (e.g.
  // literals or comparisons) fail with kTypeMismatch.
  virtual bool CollectPaths(const PathValue& input, PathMode mode,
                            std::vector<PathValue>* paths,
                            QueryError* error) const;

  // The constant this node always yields exactly once, or nullptr for nodes
  // that depend on their input.
  virtual const Value* AsLiteral() const { return nullptr; }

  // Structural representation, e.g. Pipe(Key("a"), Wildcard).
  virtual string DebugString() const = 0;

 protected:
  Node() = default;
};

typedef std::vector<std::unique_ptr<const Node>> NodeList;

}  // namespace model
}  // namespace jq_path

#endif  // JQ_PATH_INTERNAL_MODEL_NODE_H_
