//===- cmdkit/Unicode.h - UTF-8 decoding and classification -----*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Minimal Unicode support for validating flag and command names. Names are
// UTF-8 encoded std::strings and are checked one code point at a time.
//
//===----------------------------------------------------------------------===//

#ifndef CMDKIT_UNICODE_H
#define CMDKIT_UNICODE_H

#include <cstddef>
#include <string>
#include <string_view>

namespace cmdkit {

/// The code point substituted for malformed UTF-8 input.
constexpr char32_t ReplacementChar = 0xFFFD;

/// Decodes the code point at the start of \p S, which must not be empty, and
/// sets \p Size to the number of bytes it takes. A byte that does not start a
/// well-formed sequence decodes to ReplacementChar with a size of 1.
char32_t decodeUTF8Char(std::string_view S, size_t &Size);

/// Decodes \p S as UTF-8. Every byte that does not start a well-formed
/// sequence decodes to ReplacementChar and decoding resumes at the next byte.
std::u32string decodeUTF8(std::string_view S);

/// Encodes a single code point as UTF-8. Values outside the Unicode range
/// and surrogates are encoded as ReplacementChar.
std::string encodeUTF8(char32_t C);

/// Returns the number of code points in \p S.
size_t columnWidth(std::string_view S);

/// Returns true if \p C is a letter (general category L).
bool isLetter(char32_t C);

/// Returns true if \p C is a number (general category N). This includes
/// letter-like numbers such as U+216B and other numbers such as U+00B2.
bool isNumber(char32_t C);

/// Returns true if \p C is printable: a letter, mark, number, punctuation
/// character, symbol or the ASCII space.
bool isPrint(char32_t C);

/// Characters allowed as a flag alias.
inline bool isAliasChar(char32_t C) { return isLetter(C) || isNumber(C); }

/// Characters allowed in flag and command names.
inline bool isNameChar(char32_t C) { return isAliasChar(C) || C == U'-'; }

} // end namespace cmdkit

#endif // CMDKIT_UNICODE_H
