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

#include "jqpath/platform/str_util.h"

#include "absl/strings/str_format.h"

namespace strings {

namespace {

// Returns the value of a hex digit or -1.
int HexDigitValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Parses four hex digits starting at 'src[pos]'.
bool ParseHex4(absl::string_view src, size_t pos, uint32* value) {
  if (pos + 4 > src.size()) return false;
  uint32 result = 0;
  for (size_t i = pos; i < pos + 4; ++i) {
    const int digit = HexDigitValue(src[i]);
    if (digit < 0) return false;
    result = (result << 4) | static_cast<uint32>(digit);
  }
  *value = result;
  return true;
}

bool IsHighSurrogate(uint32 c) { return c >= 0xD800 && c <= 0xDBFF; }
bool IsLowSurrogate(uint32 c) { return c >= 0xDC00 && c <= 0xDFFF; }

}  // namespace

CharSet::CharSet(absl::string_view characters) {
  for (const char& c : characters) {
    Add(c);
  }
}

void AppendUtf8(uint32 code_point, string* dest) {
  if (code_point > 0x10FFFF || IsHighSurrogate(code_point) ||
      IsLowSurrogate(code_point)) {
    code_point = 0xFFFD;
  }
  if (code_point < 0x80) {
    dest->push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    dest->push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    dest->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    dest->push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    dest->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    dest->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    dest->push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    dest->push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    dest->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    dest->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

void JsonEscape(absl::string_view src, string* dest) {
  typedef absl::string_view::const_iterator Iter;
  Iter first = src.begin();
  Iter last = src.end();
  while (first != last) {
    // Advance to next character we need to escape, or to end of source
    Iter next = first;
    while (next != last) {
      const unsigned char c = static_cast<unsigned char>(*next);
      if (c < 0x20 || c == 0x7F || c == '"' || c == '\\') break;
      ++next;
    }
    // Append the whole run of non-escaped chars
    dest->append(first, next);
    if (next == last) break;
    const unsigned char c = static_cast<unsigned char>(*next++);
    switch (c) {
      case '"':
        dest->append("\\\"");
        break;
      case '\\':
        dest->append("\\\\");
        break;
      case '\b':
        dest->append("\\b");
        break;
      case '\f':
        dest->append("\\f");
        break;
      case '\n':
        dest->append("\\n");
        break;
      case '\r':
        dest->append("\\r");
        break;
      case '\t':
        dest->append("\\t");
        break;
      default:
        dest->append(absl::StrFormat("\\u%04x", c));
        break;
    }
    first = next;
  }
}

bool JsonUnescape(absl::string_view src, string* dest, size_t* error_offset) {
  size_t i = 0;
  while (i < src.size()) {
    const char c = src[i];
    if (c != '\\') {
      dest->push_back(c);
      ++i;
      continue;
    }
    const size_t escape_start = i;
    if (i + 1 >= src.size()) {
      if (error_offset != nullptr) *error_offset = escape_start;
      return false;
    }
    const char kind = src[i + 1];
    i += 2;
    switch (kind) {
      case '"':
      case '\\':
      case '/':
        dest->push_back(kind);
        break;
      case 'b':
        dest->push_back('\b');
        break;
      case 'f':
        dest->push_back('\f');
        break;
      case 'n':
        dest->push_back('\n');
        break;
      case 'r':
        dest->push_back('\r');
        break;
      case 't':
        dest->push_back('\t');
        break;
      case 'u': {
        uint32 code_point = 0;
        if (!ParseHex4(src, i, &code_point)) {
          if (error_offset != nullptr) *error_offset = escape_start;
          return false;
        }
        i += 4;
        // Combine a surrogate pair; a lone surrogate decodes to U+FFFD.
        uint32 low = 0;
        if (IsHighSurrogate(code_point) && i + 6 <= src.size() &&
            src[i] == '\\' && src[i + 1] == 'u' &&
            ParseHex4(src, i + 2, &low) && IsLowSurrogate(low)) {
          code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        }
        AppendUtf8(code_point, dest);
        break;
      }
      default:
        if (error_offset != nullptr) *error_offset = escape_start;
        return false;
    }
  }
  return true;
}

}  // namespace strings
