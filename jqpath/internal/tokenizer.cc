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

#include "jqpath/internal/tokenizer.h"

#include <cstring>
#include <utility>

#include <glog/logging.h>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "jqpath/logging.h"
#include "jqpath/platform/str_util.h"
#include "re2/re2.h"

namespace jq_path {
namespace internal {

namespace {

// Punctuation and comparison operators. The longest match wins.
const char* const kOperators[] = {
    "==", "!=", "<=", ">=", "<", ">", "|", ",", ":",
    ";",  "?",  "(",  ")",  "[", "]", "{", "}", "*",
};

const strings::CharSet& Whitespace() {
  static const auto* whitespace = new strings::CharSet(" \t\r\n");
  return *whitespace;
}

re2::StringPiece Remaining(absl::string_view expression, size_t pos) {
  return re2::StringPiece(expression.data() + pos, expression.size() - pos);
}

// Matches an identifier at the start of the remaining input.
bool ConsumeIdentifier(absl::string_view expression, size_t pos,
                       string* identifier) {
  static const LazyRE2 kIdentifierPattern = {R"RE(([A-Za-z_][A-Za-z0-9_]*))RE"};
  re2::StringPiece input = Remaining(expression, pos);
  return RE2::Consume(&input, *kIdentifierPattern, identifier);
}

// Matches a number, including an optional leading minus sign, at the start of
// the remaining input.
bool ConsumeNumber(absl::string_view expression, size_t pos, string* number) {
  static const LazyRE2 kNumberPattern = {
      R"RE((-?[0-9]+(?:\.[0-9]*)?(?:[eE][+-]?[0-9]+)?))RE"};
  re2::StringPiece input = Remaining(expression, pos);
  return RE2::Consume(&input, *kNumberPattern, number);
}

// Integral text keeps full precision up to UINT64_MAX.
Value NumberValue(const string& text) {
  if (text.find_first_of(".eE") == string::npos) {
    int64 integer = 0;
    if (absl::SimpleAtoi(text, &integer)) return Value(integer);
    uint64 unsigned_integer = 0;
    if (text[0] != '-' && absl::SimpleAtoi(text, &unsigned_integer)) {
      return Value(unsigned_integer);
    }
  }
  double number = 0;
  if (!absl::SimpleAtod(text, &number)) {
    LOG(DFATAL) << "Unparsable number token: " << text;
  }
  return Value(number);
}

// Finds the closing quote of the string starting at 'start' and decodes its
// body into 'token'.
bool ScanString(absl::string_view expression, size_t start, Token* token,
                QueryError* error) {
  size_t end = start + 1;
  while (end < expression.size() && expression[end] != '"') {
    end += expression[end] == '\\' ? 2 : 1;
  }
  if (end >= expression.size()) {
    *error = QueryError::SyntaxError("Unterminated string literal",
                                     string(expression.substr(start)),
                                     static_cast<int>(start));
    return false;
  }

  const absl::string_view body = expression.substr(start + 1, end - start - 1);
  string unescaped;
  size_t error_offset = 0;
  if (!strings::JsonUnescape(body, &unescaped, &error_offset)) {
    const size_t position = start + 1 + error_offset;
    *error = QueryError::SyntaxError(
        "Invalid escape sequence in string literal",
        string(expression.substr(position, 2)), static_cast<int>(position));
    return false;
  }
  token->kind = Token::kString;
  token->text = string(expression.substr(start, end - start + 1));
  token->value = Value(std::move(unescaped));
  return true;
}

}  // namespace

string Token::Describe() const {
  if (kind == kEnd) return "end of input";
  if (kind == kField) return absl::StrCat("'.", text, "'");
  return absl::StrCat("'", text, "'");
}

bool Tokenize(absl::string_view expression, std::vector<Token>* tokens,
              QueryError* error) {
  RETURN_FALSE_IF(tokens == nullptr);
  RETURN_FALSE_IF(error == nullptr);
  size_t pos = 0;
  while (true) {
    while (pos < expression.size() && Whitespace().Test(expression[pos])) {
      ++pos;
    }
    Token token;
    token.position = static_cast<int>(pos);
    if (pos >= expression.size()) {
      tokens->push_back(std::move(token));
      break;
    }

    const char c = expression[pos];
    string match;
    if (c == '.') {
      if (ConsumeIdentifier(expression, pos + 1, &match)) {
        token.kind = Token::kField;
        pos += 1 + match.size();
        token.text = std::move(match);
      } else {
        token.kind = Token::kDot;
        token.text = ".";
        ++pos;
      }
    } else if (c == '"') {
      if (!ScanString(expression, pos, &token, error)) return false;
      pos += token.text.size();
    } else if (absl::ascii_isdigit(c) || c == '-') {
      if (!ConsumeNumber(expression, pos, &match)) {
        *error = QueryError::SyntaxError("Unexpected character", string(1, c),
                                         static_cast<int>(pos));
        return false;
      }
      token.kind = Token::kNumber;
      token.value = NumberValue(match);
      pos += match.size();
      token.text = std::move(match);
    } else if (ConsumeIdentifier(expression, pos, &match)) {
      token.kind = Token::kIdentifier;
      pos += match.size();
      token.text = std::move(match);
    } else {
      const absl::string_view rest = expression.substr(pos);
      absl::string_view matched_op;
      for (const char* op : kOperators) {
        if (absl::StartsWith(rest, op) && strlen(op) > matched_op.size()) {
          matched_op = op;
        }
      }
      if (matched_op.empty()) {
        *error = QueryError::SyntaxError("Unexpected character", string(1, c),
                                         static_cast<int>(pos));
        return false;
      }
      token.kind = Token::kOperator;
      token.text = string(matched_op);
      pos += matched_op.size();
    }
    tokens->push_back(std::move(token));
  }

  DVLOG(1) << "Tokens: "
           << absl::StrJoin(*tokens, " ", [](string* out, const Token& token) {
                out->append(token.Describe());
              });
  return true;
}

}  // namespace internal
}  // namespace jq_path
