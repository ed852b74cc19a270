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

#include "jqpath/error.h"

#include "absl/strings/str_cat.h"

namespace jq_path {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "OK";
    case ErrorCode::kSyntaxError:
      return "SyntaxError";
    case ErrorCode::kTypeMismatch:
      return "TypeMismatch";
    case ErrorCode::kPathNotFound:
      return "PathNotFound";
    case ErrorCode::kNotFound:
      return "NotFound";
  }
  return "Unknown";
}

// static
QueryError QueryError::SyntaxError(const string& message, const string& token,
                                   int position) {
  QueryError error(ErrorCode::kSyntaxError, message);
  error.token_ = token;
  error.position_ = position;
  return error;
}

// static
QueryError QueryError::TypeMismatch(const string& message) {
  return QueryError(ErrorCode::kTypeMismatch, message);
}

// static
QueryError QueryError::PathNotFound(const string& message) {
  return QueryError(ErrorCode::kPathNotFound, message);
}

// static
QueryError QueryError::NotFound() {
  return QueryError(ErrorCode::kNotFound, "No result");
}

string QueryError::ToString() const {
  if (ok()) return "OK";
  if (code_ == ErrorCode::kSyntaxError && position_ >= 0) {
    return absl::StrCat(ErrorCodeName(code_), ": ", message_, " at position ",
                        position_);
  }
  return absl::StrCat(ErrorCodeName(code_), ": ", message_);
}

std::ostream& operator<<(std::ostream& os, const QueryError& error) {
  return os << error.ToString();
}

}  // namespace jq_path
