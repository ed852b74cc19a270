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

#ifndef JQ_PATH_FUNCTION_REGISTRY_H_
#define JQ_PATH_FUNCTION_REGISTRY_H_

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>

#include "jqpath/internal/model/node.h"
#include "jqpath/platform/types.h"

namespace jq_path {

// Maps the functions callable from a filter expression, identified by name and
// number of arguments, to builders of the nodes that implement them. The
// parser consults the registry while it parses; an expression calling a
// function the registry does not know is a syntax error.
//
// Sample use:
//  FunctionRegistry registry;
//  registry.RegisterFunction(
//      "always_true", 0, [](model::NodeList args) {
//        return absl::make_unique<model::Literal>(Value(true));
//      });
//  auto query = Query::Create("select(always_true)", registry, &error);
class FunctionRegistry {
 public:
  // Builds the node for one call. 'args' holds one parsed argument expression
  // per parameter.
  typedef std::function<std::unique_ptr<const model::Node>(model::NodeList)>
      NodeBuilder;

  // The constructor registers the built-in functions.
  FunctionRegistry();
  FunctionRegistry(const FunctionRegistry&) = default;
  FunctionRegistry& operator=(const FunctionRegistry&) = default;
  ~FunctionRegistry() = default;

  // A shared registry holding only the built-in functions.
  static const FunctionRegistry& Default();

  // Returns true if registration is successful. Registering another builder
  // for an already registered name and arity keeps the existing one and
  // returns false.
  bool RegisterFunction(const string& name, int arity, NodeBuilder builder);

  bool HasFunction(const string& name, int arity) const;

  // True if a function of that name exists with any arity.
  bool HasFunctionName(const string& name) const;

  // Returns the node for calling 'name' with 'args' or nullptr if no such
  // function is registered.
  std::unique_ptr<const model::Node> Build(const string& name,
                                           model::NodeList args) const;

 private:
  std::map<std::pair<string, int>, NodeBuilder> builders_;
};

}  // namespace jq_path

#endif  // JQ_PATH_FUNCTION_REGISTRY_H_
