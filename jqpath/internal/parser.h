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

#ifndef JQ_PATH_INTERNAL_PARSER_H_
#define JQ_PATH_INTERNAL_PARSER_H_

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "jqpath/error.h"
#include "jqpath/function_registry.h"
#include "jqpath/internal/model/node.h"
#include "jqpath/internal/tokenizer.h"

namespace jq_path {
namespace internal {

// Recursive descent parser for filter expressions. From the loosest to the
// tightest binding:
//
//   pipe        := comma ('|' comma)*                      left associative
//   comma       := or (',' or)*
//   or          := and ('or' and)*
//   and         := comparison ('and' comparison)*
//   comparison  := postfix [('=='|'!='|'<'|'<='|'>'|'>=') postfix]
//   postfix     := primary (accessor ['?'] | '?')*
//   accessor    := '.name' | '."name"' | '.*' | ['.'] '[' [subscript] ']'
//   subscript   := string | number | [number] ':' [number]
//   primary     := '.' | accessor | literal | '(' pipe ')' | '[' [pipe] ']'
//                | '{' [entry (',' entry)*] '}' | name ['(' pipe (';' pipe)* ')']
//   entry       := (name | string) [':' value] | '(' pipe ')' ':' value
//
// where 'value' is a pipe without top level commas. An empty expression is the
// identity. Nested pipes deeper than 256 levels are rejected as syntax errors.
class Parser {
 public:
  // Does not take ownership of 'registry', which must outlive the parser.
  explicit Parser(const FunctionRegistry* registry);
  Parser(const Parser&) = delete;
  Parser& operator=(const Parser&) = delete;
  ~Parser() = default;

  // Returns the root of the parsed tree, or nullptr with a kSyntaxError in
  // 'error' carrying the offending token and its position.
  std::unique_ptr<const model::Node> Parse(absl::string_view expression,
                                           QueryError* error);

 private:
  typedef std::unique_ptr<const model::Node> NodePtr;

  NodePtr ParsePipe(bool allow_comma);
  NodePtr ParseComma(bool allow_comma);
  NodePtr ParseOr();
  NodePtr ParseAnd();
  NodePtr ParseComparison();
  NodePtr ParsePostfix();
  NodePtr ParsePrimary();
  NodePtr ParseArrayConstruct();
  NodePtr ParseObjectConstruct();
  NodePtr ParseFunctionCall();

  // Parses an accessor starting at the current token, including a trailing
  // '?'. Returns nullptr without an error if the current token does not start
  // an accessor. A '[' without a leading '.' only starts an accessor if
  // 'allow_bare_bracket' is set; otherwise it starts an array construction.
  NodePtr ParseAccessor(bool allow_bare_bracket);

  const Token& Peek(int ahead = 0) const;
  const Token& Advance();
  bool ConsumeOperator(absl::string_view op);
  bool ExpectOperator(absl::string_view op);

  // Records a syntax error at 'token' and returns nullptr.
  std::nullptr_t Fail(const string& message, const Token& token);
  std::nullptr_t UnexpectedToken(const Token& token);

  const FunctionRegistry* const registry_;
  std::vector<Token> tokens_;
  size_t pos_ = 0;
  // Number of ParsePipe calls in progress.
  int depth_ = 0;
  QueryError error_;
};

}  // namespace internal
}  // namespace jq_path

#endif  // JQ_PATH_INTERNAL_PARSER_H_
