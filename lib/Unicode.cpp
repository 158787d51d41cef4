//===-- Unicode.cpp - UTF-8 decoding and classification -------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The classification tables are generated from the Unicode database by
// utils/UnicodeTables.py. Each table is sorted and non-overlapping.
//
//===----------------------------------------------------------------------===//

#include "cmdkit/Unicode.h"

#include <algorithm>
#include <iterator>

using namespace cmdkit;

namespace {

struct CodePointRange {
  char32_t Lo;
  char32_t Hi;
};

#include "UnicodeTables.inc"

template <size_t N>
bool inRanges(const CodePointRange (&Ranges)[N], char32_t C) {
  auto I = std::upper_bound(
      std::begin(Ranges), std::end(Ranges), C,
      [](char32_t V, const CodePointRange &R) { return V < R.Lo; });
  if (I == std::begin(Ranges))
    return false;
  --I;
  return C <= I->Hi;
}

} // namespace

char32_t cmdkit::decodeUTF8Char(std::string_view S, size_t &Size) {
  static const char32_t MinForLength[] = {0, 0, 0x80, 0x800, 0x10000};

  Size = 1;
  unsigned char Lead = static_cast<unsigned char>(S.front());
  if (Lead < 0x80)
    return Lead;

  size_t Len;
  char32_t C;
  if ((Lead & 0xE0) == 0xC0) {
    Len = 2;
    C = Lead & 0x1F;
  } else if ((Lead & 0xF0) == 0xE0) {
    Len = 3;
    C = Lead & 0x0F;
  } else if ((Lead & 0xF8) == 0xF0) {
    Len = 4;
    C = Lead & 0x07;
  } else {
    return ReplacementChar;
  }

  if (S.size() < Len)
    return ReplacementChar;
  for (size_t K = 1; K != Len; ++K) {
    unsigned char Cont = static_cast<unsigned char>(S[K]);
    if ((Cont & 0xC0) != 0x80)
      return ReplacementChar;
    C = (C << 6) | (Cont & 0x3F);
  }

  // Overlong forms, surrogates and values past U+10FFFF are malformed.
  if (C < MinForLength[Len] || C > 0x10FFFF || (C >= 0xD800 && C <= 0xDFFF))
    return ReplacementChar;

  Size = Len;
  return C;
}

std::u32string cmdkit::decodeUTF8(std::string_view S) {
  std::u32string Result;
  Result.reserve(S.size());
  while (!S.empty()) {
    size_t Size;
    Result.push_back(decodeUTF8Char(S, Size));
    S.remove_prefix(Size);
  }
  return Result;
}

std::string cmdkit::encodeUTF8(char32_t C) {
  if (C > 0x10FFFF || (C >= 0xD800 && C <= 0xDFFF))
    C = ReplacementChar;

  std::string Result;
  if (C < 0x80) {
    Result.push_back(static_cast<char>(C));
  } else if (C < 0x800) {
    Result.push_back(static_cast<char>(0xC0 | (C >> 6)));
    Result.push_back(static_cast<char>(0x80 | (C & 0x3F)));
  } else if (C < 0x10000) {
    Result.push_back(static_cast<char>(0xE0 | (C >> 12)));
    Result.push_back(static_cast<char>(0x80 | ((C >> 6) & 0x3F)));
    Result.push_back(static_cast<char>(0x80 | (C & 0x3F)));
  } else {
    Result.push_back(static_cast<char>(0xF0 | (C >> 18)));
    Result.push_back(static_cast<char>(0x80 | ((C >> 12) & 0x3F)));
    Result.push_back(static_cast<char>(0x80 | ((C >> 6) & 0x3F)));
    Result.push_back(static_cast<char>(0x80 | (C & 0x3F)));
  }
  return Result;
}

size_t cmdkit::columnWidth(std::string_view S) {
  return decodeUTF8(S).size();
}

bool cmdkit::isLetter(char32_t C) { return inRanges(LetterRanges, C); }

bool cmdkit::isNumber(char32_t C) { return inRanges(NumberRanges, C); }

bool cmdkit::isPrint(char32_t C) { return inRanges(PrintRanges, C); }
