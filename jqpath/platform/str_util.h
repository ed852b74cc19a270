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

#ifndef JQ_PATH_PLATFORM_STR_UTIL_H_
#define JQ_PATH_PLATFORM_STR_UTIL_H_

#include <bitset>

#include "absl/strings/string_view.h"
#include "jqpath/platform/types.h"

namespace strings {

class CharSet {
 public:
  explicit CharSet(absl::string_view characters);

  // Add or remove a character from the set.
  void Add(unsigned char c) { bits_.set(c); }
  void Remove(unsigned char c) { bits_.reset(c); }

  // Return true if this character is in the set
  bool Test(unsigned char c) const { return bits_[c]; }

 private:
  std::bitset<256> bits_;
};

// Appends the UTF-8 encoding of 'code_point' to 'dest'. Code points above
// U+10FFFF and lone surrogates are replaced with U+FFFD.
void AppendUtf8(uint32 code_point, string* dest);

// Appends 'src' to 'dest' escaped as the body of a JSON string literal (the
// surrounding quotes are not added). Quote, backslash and all control
// characters below 0x20 as well as DEL are escaped; other bytes, including
// multi-byte UTF-8 sequences, are copied through.
void JsonEscape(absl::string_view src, string* dest);

// Decodes the body of a JSON string literal, i.e. the text between the
// quotes, resolving all backslash escapes including \uXXXX surrogate pairs.
// Returns false on a malformed escape and sets 'error_offset' (if non-null)
// to the offset of the offending backslash within 'src'.
bool JsonUnescape(absl::string_view src, string* dest, size_t* error_offset);

}  // namespace strings

#endif  // JQ_PATH_PLATFORM_STR_UTIL_H_
