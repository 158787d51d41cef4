//===-- StringExtras.cpp - Quoting and column helpers ---------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "cmdkit/StringExtras.h"
#include "cmdkit/Unicode.h"

#include <algorithm>

using namespace cmdkit;

static const char HexDigits[] = "0123456789abcdef";

static void appendHex(std::string &Out, unsigned Value, unsigned Digits) {
  for (unsigned I = Digits; I != 0; --I)
    Out.push_back(HexDigits[(Value >> (4 * (I - 1))) & 0xF]);
}

// Appends \p C as it appears inside a literal delimited by \p Quote.
// Printable characters are copied; everything else is escaped.
static void appendQuotedChar(std::string &Out, char32_t C, char Quote) {
  if (C == static_cast<char32_t>(Quote) || C == '\\') {
    Out.push_back('\\');
    Out.push_back(static_cast<char>(C));
    return;
  }
  if (isPrint(C)) {
    Out += encodeUTF8(C);
    return;
  }

  switch (C) {
  case '\a':
    Out += "\\a";
    return;
  case '\b':
    Out += "\\b";
    return;
  case '\f':
    Out += "\\f";
    return;
  case '\n':
    Out += "\\n";
    return;
  case '\r':
    Out += "\\r";
    return;
  case '\t':
    Out += "\\t";
    return;
  case '\v':
    Out += "\\v";
    return;
  default:
    break;
  }

  if (C < 0x20 || C == 0x7F) {
    Out += "\\x";
    appendHex(Out, C, 2);
    return;
  }
  if (C > 0x10FFFF || (C >= 0xD800 && C <= 0xDFFF))
    C = ReplacementChar;
  if (C < 0x10000) {
    Out += "\\u";
    appendHex(Out, C, 4);
    return;
  }
  Out += "\\U";
  appendHex(Out, C, 8);
}

std::string cmdkit::quote(std::string_view S) {
  std::string Result = "\"";
  while (!S.empty()) {
    size_t Size;
    char32_t C = decodeUTF8Char(S, Size);
    // A byte that is not valid UTF-8 is escaped by its value.
    if (C == ReplacementChar && Size == 1) {
      Result += "\\x";
      appendHex(Result, static_cast<unsigned char>(S.front()), 2);
    } else {
      appendQuotedChar(Result, C, '"');
    }
    S.remove_prefix(Size);
  }
  Result.push_back('"');
  return Result;
}

std::string cmdkit::quoteChar(char32_t C) {
  std::string Result = "'";
  appendQuotedChar(Result, C, '\'');
  Result.push_back('\'');
  return Result;
}

std::string cmdkit::join(const std::vector<std::string> &Parts,
                         std::string_view Separator) {
  std::string Result;
  for (size_t I = 0, E = Parts.size(); I != E; ++I) {
    if (I)
      Result.append(Separator);
    Result.append(Parts[I]);
  }
  return Result;
}

std::string cmdkit::padRight(std::string_view S, size_t Width) {
  std::string Result(S);
  size_t Len = columnWidth(S);
  if (Len < Width)
    Result.append(Width - Len, ' ');
  return Result;
}

std::string_view cmdkit::trimTrailingNewlines(std::string_view S) {
  while (!S.empty() && S.back() == '\n')
    S.remove_suffix(1);
  return S;
}

std::string cmdkit::formatColumns(const std::vector<ColumnRow> &Rows,
                                  std::string_view Indent) {
  size_t Width = 0;
  for (const auto &Row : Rows)
    Width = std::max(Width, columnWidth(Row.first));

  std::string Result;
  for (const auto &Row : Rows) {
    Result.append(Indent);
    Result.append(padRight(Row.first, Width));
    Result.append(Indent);
    Result.append(Row.second);
    Result.push_back('\n');
  }
  return Result;
}
