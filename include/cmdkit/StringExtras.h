//===- cmdkit/StringExtras.h - Quoting and column helpers -------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#ifndef CMDKIT_STRINGEXTRAS_H
#define CMDKIT_STRINGEXTRAS_H

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cmdkit {

/// Returns \p S as a double-quoted literal. Printable characters are copied.
/// Quotes and backslashes are escaped with a backslash, control characters
/// as \n or \xNN, other non-printable characters as \uNNNN or \UNNNNNNNN,
/// and bytes that are not valid UTF-8 as \xNN.
std::string quote(std::string_view S);

/// Returns \p C as a single-quoted character literal, escaped like quote().
std::string quoteChar(char32_t C);

/// Joins \p Parts with \p Separator.
std::string join(const std::vector<std::string> &Parts,
                 std::string_view Separator);

/// Pads \p S with spaces on the right to \p Width code points.
std::string padRight(std::string_view S, size_t Width);

/// Removes every trailing '\n' from \p S.
std::string_view trimTrailingNewlines(std::string_view S);

/// A row of a two column listing: the name column and its description.
using ColumnRow = std::pair<std::string, std::string>;

/// Formats \p Rows one per line as Indent, the name padded to the widest
/// name, Indent, then the description.
std::string formatColumns(const std::vector<ColumnRow> &Rows,
                          std::string_view Indent);

} // end namespace cmdkit

#endif // CMDKIT_STRINGEXTRAS_H
