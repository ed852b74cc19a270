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

#ifndef JQ_PATH_INTERNAL_TOKENIZER_H_
#define JQ_PATH_INTERNAL_TOKENIZER_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "jqpath/error.h"
#include "jqpath/platform/types.h"
#include "jqpath/value.h"

namespace jq_path {
namespace internal {

// A lexical token of a filter expression.
struct Token {
  enum Kind {
    // End of the expression; always the last token.
    kEnd = 0,
    // A '.' not directly followed by a field name.
    kDot,
    // '.name'; 'text' holds the name.
    kField,
    // A bare word such as 'select', 'and' or 'true'.
    kIdentifier,
    // A double quoted string; 'value' holds the unescaped string.
    kString,
    // A numeric literal, possibly negative; 'value' holds the number.
    kNumber,
    // Punctuation and comparison operators, e.g. '|', '[', '=='.
    kOperator,
  };

  Kind kind = kEnd;
  // The token as it appears in the expression, except for kField where the
  // leading '.' is dropped.
  string text;
  Value value;
  // Byte offset of the token in the expression.
  int position = 0;

  bool IsOperator(absl::string_view op) const {
    return kind == kOperator && text == op;
  }
  bool IsIdentifier(absl::string_view name) const {
    return kind == kIdentifier && text == name;
  }

  // E.g. "'['" or "end of input", for error messages.
  string Describe() const;
};

// Splits 'expression' into tokens, ending with a kEnd token. Whitespace
// separates tokens and is otherwise ignored. Returns false with a kSyntaxError
// in 'error' on an unterminated string, a malformed escape sequence or a
// character that cannot start a token.
bool Tokenize(absl::string_view expression, std::vector<Token>* tokens,
              QueryError* error);

}  // namespace internal
}  // namespace jq_path

#endif  // JQ_PATH_INTERNAL_TOKENIZER_H_
