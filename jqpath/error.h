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

#ifndef JQ_PATH_ERROR_H_
#define JQ_PATH_ERROR_H_

#include <ostream>
#include <string>

#include "jqpath/platform/types.h"

namespace jq_path {

enum class ErrorCode {
  kOk = 0,
  // The filter expression is malformed. Never partially evaluated.
  kSyntaxError,
  // An operation was applied to a value of an incompatible kind.
  kTypeMismatch,
  // A key or index that was not marked optional does not exist.
  kPathNotFound,
  // First() found no result. Not a failure of the evaluation itself.
  kNotFound,
};

// Returns a readable name such as "SyntaxError".
const char* ErrorCodeName(ErrorCode code);

// Describes the outcome of parsing or evaluating a query. A default
// constructed QueryError is ok().
class QueryError {
 public:
  QueryError() = default;
  QueryError(ErrorCode code, const string& message)
      : code_(code), message_(message) {}

  static QueryError SyntaxError(const string& message, const string& token,
                                int position);
  static QueryError TypeMismatch(const string& message);
  static QueryError PathNotFound(const string& message);
  static QueryError NotFound();

  bool ok() const { return code_ == ErrorCode::kOk; }
  ErrorCode code() const { return code_; }
  const string& message() const { return message_; }

  // The offending token and its byte offset in the expression. Only set for
  // syntax errors; 'position' is -1 otherwise.
  const string& token() const { return token_; }
  int position() const { return position_; }

  // E.g. "SyntaxError: Unexpected token ']' at position 3".
  string ToString() const;

 private:
  ErrorCode code_ = ErrorCode::kOk;
  string message_;
  string token_;
  int position_ = -1;
};

std::ostream& operator<<(std::ostream& os, const QueryError& error);

}  // namespace jq_path

#endif  // JQ_PATH_ERROR_H_
