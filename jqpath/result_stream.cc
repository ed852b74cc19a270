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

#include "jqpath/result_stream.h"

#include <utility>

#include "jqpath/logging.h"

namespace jq_path {

bool ResultStream::Fail(const QueryError& error) {
  if (error_.ok()) error_ = error;
  return false;
}

bool DrainStream(ResultStream* stream, std::vector<Value>* results,
                 QueryError* error) {
  RETURN_FALSE_IF(stream == nullptr);
  RETURN_FALSE_IF(results == nullptr);
  Value result;
  while (stream->Next(&result)) {
    results->push_back(std::move(result));
  }
  if (!stream->ok()) {
    if (error != nullptr) *error = stream->error();
    return false;
  }
  return true;
}

}  // namespace jq_path
