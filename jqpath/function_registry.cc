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

#include "jqpath/function_registry.h"

#include <glog/logging.h>

#include "absl/memory/memory.h"
#include "jqpath/internal/model/model.h"
#include "jqpath/platform/map_util.h"

namespace jq_path {

namespace {

// Registers a zero argument function whose node has a default constructor.
template <typename NodeType>
void RegisterNullary(const string& name, FunctionRegistry* registry) {
  registry->RegisterFunction(name, 0, [](model::NodeList args) {
    return std::unique_ptr<const model::Node>(absl::make_unique<NodeType>());
  });
}

void RegisterTypeFilter(const string& name, model::TypeFilter::Kind kind,
                        FunctionRegistry* registry) {
  registry->RegisterFunction(name, 0, [kind](model::NodeList args) {
    return std::unique_ptr<const model::Node>(
        absl::make_unique<model::TypeFilter>(kind));
  });
}

}  // namespace

FunctionRegistry::FunctionRegistry() {
  RegisterFunction("select", 1, [](model::NodeList args) {
    return std::unique_ptr<const model::Node>(
        absl::make_unique<model::Select>(std::move(args[0])));
  });
  RegisterFunction("paths", 0, [](model::NodeList args) {
    return std::unique_ptr<const model::Node>(
        absl::make_unique<model::Paths>(nullptr));
  });
  RegisterFunction("paths", 1, [](model::NodeList args) {
    return std::unique_ptr<const model::Node>(
        absl::make_unique<model::Paths>(std::move(args[0])));
  });
  RegisterFunction("del", 1, [](model::NodeList args) {
    return std::unique_ptr<const model::Node>(
        absl::make_unique<model::Delete>(std::move(args[0])));
  });
  RegisterNullary<model::Not>("not", this);
  RegisterNullary<model::Empty>("empty", this);

  RegisterTypeFilter("arrays", model::TypeFilter::kArrays, this);
  RegisterTypeFilter("objects", model::TypeFilter::kObjects, this);
  RegisterTypeFilter("iterables", model::TypeFilter::kIterables, this);
  RegisterTypeFilter("scalars", model::TypeFilter::kScalars, this);
  RegisterTypeFilter("booleans", model::TypeFilter::kBooleans, this);
  RegisterTypeFilter("numbers", model::TypeFilter::kNumbers, this);
  RegisterTypeFilter("strings", model::TypeFilter::kStrings, this);
  RegisterTypeFilter("nulls", model::TypeFilter::kNulls, this);
  RegisterTypeFilter("values", model::TypeFilter::kValues, this);
}

// static
const FunctionRegistry& FunctionRegistry::Default() {
  static const auto* registry = new FunctionRegistry();
  return *registry;
}

bool FunctionRegistry::RegisterFunction(const string& name, int arity,
                                        NodeBuilder builder) {
  if (!gtl::InsertIfNotPresent(&builders_, std::make_pair(name, arity),
                               std::move(builder))) {
    LOG(WARNING) << "Function already registered: " << name << "/" << arity;
    return false;
  }
  return true;
}

bool FunctionRegistry::HasFunction(const string& name, int arity) const {
  return gtl::ContainsKey(builders_, std::make_pair(name, arity));
}

bool FunctionRegistry::HasFunctionName(const string& name) const {
  auto it = builders_.lower_bound(std::make_pair(name, 0));
  return it != builders_.end() && it->first.first == name;
}

std::unique_ptr<const model::Node> FunctionRegistry::Build(
    const string& name, model::NodeList args) const {
  const int arity = static_cast<int>(args.size());
  const NodeBuilder* builder =
      gtl::FindOrNull(builders_, std::make_pair(name, arity));
  if (builder == nullptr) {
    LOG(INFO) << "No function registered for " << name << "/" << arity;
    return nullptr;
  }
  return (*builder)(std::move(args));
}

}  // namespace jq_path
