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

#include "jqpath/internal/parser.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include <glog/logging.h>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"
#include "jqpath/internal/model/model.h"
#include "jqpath/logging.h"

namespace jq_path {
namespace internal {

namespace {

const char* const kCompareOps[] = {"==", "!=", "<", "<=", ">", ">="};

// Returns true and sets 'op' if 'token' is a comparison operator.
bool GetCompareOp(const Token& token, model::CompareOp* op) {
  if (token.kind != Token::kOperator) return false;
  for (size_t i = 0; i < sizeof(kCompareOps) / sizeof(kCompareOps[0]); ++i) {
    if (token.text == kCompareOps[i]) {
      *op = static_cast<model::CompareOp>(i);
      return true;
    }
  }
  return false;
}

// Subexpressions in parentheses, brackets, braces and call arguments nest at
// most this deep.
constexpr int kMaxNestingDepth = 256;

// Array positions are integers; fractional positions are rounded down.
int64 ToPosition(const Value& number) {
  if (number.IsInteger()) return number.AsInt64();
  return Value(std::floor(number.AsDouble())).AsInt64();
}

}  // namespace

Parser::Parser(const FunctionRegistry* registry) : registry_(registry) {}

std::unique_ptr<const model::Node> Parser::Parse(absl::string_view expression,
                                                 QueryError* error) {
  RETURN_NULL_IF(error == nullptr);
  tokens_.clear();
  pos_ = 0;
  depth_ = 0;
  error_ = QueryError();
  if (!Tokenize(expression, &tokens_, error)) return nullptr;

  NodePtr root;
  if (Peek().kind == Token::kEnd) {
    root = absl::make_unique<model::Identity>();
  } else {
    root = ParsePipe(/*allow_comma=*/true);
    if (root != nullptr && Peek().kind != Token::kEnd) {
      root = UnexpectedToken(Peek());
    }
  }
  if (root == nullptr) {
    *error = error_;
    return nullptr;
  }
  VLOG(1) << "Parsed '" << expression << "' as " << root->DebugString();
  return root;
}

Parser::NodePtr Parser::ParsePipe(bool allow_comma) {
  if (depth_ >= kMaxNestingDepth) {
    return Fail("Exceeds depth limit for parsing", Peek());
  }
  ++depth_;
  NodePtr left = ParseComma(allow_comma);
  while (left != nullptr && ConsumeOperator("|")) {
    NodePtr right = ParseComma(allow_comma);
    if (right == nullptr) {
      left = nullptr;
      break;
    }
    left = absl::make_unique<model::Pipe>(std::move(left), std::move(right));
  }
  --depth_;
  return left;
}

Parser::NodePtr Parser::ParseComma(bool allow_comma) {
  NodePtr first = ParseOr();
  if (first == nullptr || !allow_comma || !Peek().IsOperator(",")) {
    return first;
  }
  model::NodeList branches;
  branches.push_back(std::move(first));
  while (ConsumeOperator(",")) {
    NodePtr branch = ParseOr();
    if (branch == nullptr) return nullptr;
    branches.push_back(std::move(branch));
  }
  return absl::make_unique<model::Comma>(std::move(branches));
}

Parser::NodePtr Parser::ParseOr() {
  NodePtr left = ParseAnd();
  while (left != nullptr && Peek().IsIdentifier("or")) {
    Advance();
    NodePtr right = ParseAnd();
    if (right == nullptr) return nullptr;
    left = absl::make_unique<model::BooleanOp>(
        model::BooleanOp::kOr, std::move(left), std::move(right));
  }
  return left;
}

Parser::NodePtr Parser::ParseAnd() {
  NodePtr left = ParseComparison();
  while (left != nullptr && Peek().IsIdentifier("and")) {
    Advance();
    NodePtr right = ParseComparison();
    if (right == nullptr) return nullptr;
    left = absl::make_unique<model::BooleanOp>(
        model::BooleanOp::kAnd, std::move(left), std::move(right));
  }
  return left;
}

Parser::NodePtr Parser::ParseComparison() {
  NodePtr lhs = ParsePostfix();
  model::CompareOp op;
  if (lhs == nullptr || !GetCompareOp(Peek(), &op)) return lhs;
  Advance();
  NodePtr rhs = ParsePostfix();
  if (rhs == nullptr) return nullptr;
  model::CompareOp chained;
  if (GetCompareOp(Peek(), &chained)) {
    return Fail("Comparison operators cannot be chained", Peek());
  }
  return absl::make_unique<model::Comparison>(op, std::move(lhs),
                                              std::move(rhs));
}

Parser::NodePtr Parser::ParsePostfix() {
  NodePtr term = ParsePrimary();
  while (term != nullptr) {
    NodePtr accessor = ParseAccessor(/*allow_bare_bracket=*/true);
    if (!error_.ok()) return nullptr;
    if (accessor != nullptr) {
      term = absl::make_unique<model::Pipe>(std::move(term),
                                            std::move(accessor));
    } else if (ConsumeOperator("?")) {
      term = absl::make_unique<model::Optional>(std::move(term));
    } else {
      break;
    }
  }
  return term;
}

Parser::NodePtr Parser::ParsePrimary() {
  NodePtr accessor = ParseAccessor(/*allow_bare_bracket=*/false);
  if (accessor != nullptr || !error_.ok()) return accessor;

  const Token& token = Peek();
  switch (token.kind) {
    case Token::kDot:
      Advance();
      return absl::make_unique<model::Identity>();
    case Token::kNumber:
    case Token::kString:
      Advance();
      return absl::make_unique<model::Literal>(token.value);
    case Token::kIdentifier:
      if (token.text == "true" || token.text == "false") {
        Advance();
        return absl::make_unique<model::Literal>(Value(token.text == "true"));
      }
      if (token.text == "null") {
        Advance();
        return absl::make_unique<model::Literal>(Value());
      }
      if (token.text == "and" || token.text == "or") {
        return UnexpectedToken(token);
      }
      return ParseFunctionCall();
    case Token::kOperator:
      if (token.IsOperator("(")) {
        Advance();
        NodePtr inner = ParsePipe(/*allow_comma=*/true);
        if (inner == nullptr || !ExpectOperator(")")) return nullptr;
        return inner;
      }
      if (token.IsOperator("[")) return ParseArrayConstruct();
      if (token.IsOperator("{")) return ParseObjectConstruct();
      return UnexpectedToken(token);
    case Token::kField:
    case Token::kEnd:
      break;
  }
  return UnexpectedToken(token);
}

Parser::NodePtr Parser::ParseArrayConstruct() {
  Advance();  // '['
  if (ConsumeOperator("]")) {
    return absl::make_unique<model::ArrayConstruct>(nullptr);
  }
  NodePtr body = ParsePipe(/*allow_comma=*/true);
  if (body == nullptr || !ExpectOperator("]")) return nullptr;
  return absl::make_unique<model::ArrayConstruct>(std::move(body));
}

Parser::NodePtr Parser::ParseObjectConstruct() {
  Advance();  // '{'
  std::vector<model::ObjectEntry> entries;
  if (!ConsumeOperator("}")) {
    while (true) {
      const Token& token = Peek();
      model::ObjectEntry entry;
      if (token.kind == Token::kIdentifier || token.kind == Token::kString) {
        Advance();
        const string key =
            token.kind == Token::kString ? token.value.AsString() : token.text;
        entry.key = absl::make_unique<model::Literal>(Value(key));
        if (ConsumeOperator(":")) {
          entry.value = ParsePipe(/*allow_comma=*/false);
          if (entry.value == nullptr) return nullptr;
        } else {
          // '{id}' is short for '{id: .id}'.
          entry.value = absl::make_unique<model::Key>(key, false);
        }
      } else if (token.IsOperator("(")) {
        Advance();
        entry.key = ParsePipe(/*allow_comma=*/true);
        if (entry.key == nullptr || !ExpectOperator(")") ||
            !ExpectOperator(":")) {
          return nullptr;
        }
        entry.value = ParsePipe(/*allow_comma=*/false);
        if (entry.value == nullptr) return nullptr;
      } else {
        return Fail(absl::StrCat("Expected an object key but found ",
                                 token.Describe()),
                    token);
      }
      entries.push_back(std::move(entry));

      if (ConsumeOperator("}")) break;
      if (!ExpectOperator(",")) return nullptr;
    }
  }
  return absl::make_unique<model::ObjectConstruct>(std::move(entries));
}

Parser::NodePtr Parser::ParseFunctionCall() {
  const Token& name = Advance();
  model::NodeList args;
  if (ConsumeOperator("(")) {
    do {
      NodePtr arg = ParsePipe(/*allow_comma=*/true);
      if (arg == nullptr) return nullptr;
      args.push_back(std::move(arg));
    } while (ConsumeOperator(";"));
    if (!ExpectOperator(")")) return nullptr;
  }

  const int arity = static_cast<int>(args.size());
  if (!registry_->HasFunction(name.text, arity)) {
    return Fail(absl::Substitute(registry_->HasFunctionName(name.text)
                                     ? "Function $0 does not take $1 arguments"
                                     : "Unknown function $0/$1",
                                 name.text, arity),
                name);
  }
  DVLOG(1) << "Calling " << name.text << "/" << arity;
  return registry_->Build(name.text, std::move(args));
}

Parser::NodePtr Parser::ParseAccessor(bool allow_bare_bracket) {
  const Token& token = Peek();
  if (token.kind == Token::kField) {
    Advance();
    const bool optional = ConsumeOperator("?");
    return absl::make_unique<model::Key>(token.text, optional);
  }

  if (token.kind == Token::kDot) {
    const Token& next = Peek(1);
    if (next.kind == Token::kString) {
      Advance();
      Advance();
      const bool optional = ConsumeOperator("?");
      return absl::make_unique<model::Key>(next.value.AsString(), optional);
    }
    if (next.IsOperator("*")) {
      Advance();
      Advance();
      return absl::make_unique<model::Wildcard>(ConsumeOperator("?"));
    }
    if (!next.IsOperator("[")) return nullptr;
    Advance();  // '.'
  } else if (!allow_bare_bracket || !token.IsOperator("[")) {
    return nullptr;
  }

  const Token& open = Advance();  // '['
  if (ConsumeOperator("]")) {
    return absl::make_unique<model::Wildcard>(ConsumeOperator("?"));
  }

  const Token& first = Peek();
  if (first.kind == Token::kString) {
    Advance();
    if (!ExpectOperator("]")) return nullptr;
    return absl::make_unique<model::Key>(first.value.AsString(),
                                         ConsumeOperator("?"));
  }

  bool has_start = false;
  int64 start = 0;
  if (first.kind == Token::kNumber) {
    Advance();
    has_start = true;
    start = ToPosition(first.value);
    if (ConsumeOperator("]")) {
      return absl::make_unique<model::Index>(start, ConsumeOperator("?"));
    }
  }
  if (!Peek().IsOperator(":")) {
    return Fail(absl::StrCat("Expected a string, a number or a slice after ",
                             open.Describe(), " but found ",
                             Peek().Describe()),
                Peek());
  }
  Advance();  // ':'
  bool has_end = false;
  int64 end = 0;
  if (Peek().kind == Token::kNumber) {
    has_end = true;
    end = ToPosition(Advance().value);
  }
  if (!has_start && !has_end) {
    return Fail("A slice needs at least one bound", Peek());
  }
  if (!ExpectOperator("]")) return nullptr;
  return absl::make_unique<model::Slice>(has_start, start, has_end, end,
                                         ConsumeOperator("?"));
}

const Token& Parser::Peek(int ahead) const {
  const size_t index = std::min(pos_ + ahead, tokens_.size() - 1);
  return tokens_[index];
}

const Token& Parser::Advance() {
  const Token& token = tokens_[pos_];
  if (pos_ + 1 < tokens_.size()) ++pos_;
  return token;
}

bool Parser::ConsumeOperator(absl::string_view op) {
  if (!Peek().IsOperator(op)) return false;
  Advance();
  return true;
}

bool Parser::ExpectOperator(absl::string_view op) {
  if (ConsumeOperator(op)) return true;
  Fail(absl::StrCat("Expected '", op, "' but found ", Peek().Describe()),
       Peek());
  return false;
}

std::nullptr_t Parser::Fail(const string& message, const Token& token) {
  if (error_.ok()) {
    error_ = QueryError::SyntaxError(
        message, token.kind == Token::kEnd ? "" : token.text, token.position);
    VLOG(1) << "Parse failed: " << error_;
  }
  return nullptr;
}

std::nullptr_t Parser::UnexpectedToken(const Token& token) {
  if (token.kind == Token::kEnd) return Fail("Unexpected end of input", token);
  return Fail(absl::StrCat("Unexpected token ", token.Describe()), token);
}

}  // namespace internal
}  // namespace jq_path
