//===-- Flag.cpp - Command line flags -------------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "cmdkit/Flag.h"
#include "cmdkit/StringExtras.h"
#include "cmdkit/Unicode.h"

#include <set>

using namespace cmdkit;

static std::string_view LongPrefix = "--";
static std::string_view ShortPrefix = "-";

//===----------------------------------------------------------------------===//
// Flag implementation
//

bool Flag::matches(std::string_view Token) const {
  if (Token.size() == LongPrefix.size() + Name.size() &&
      Token.substr(0, LongPrefix.size()) == LongPrefix &&
      Token.substr(LongPrefix.size()) == Name)
    return true;
  return hasAlias() && Token.size() == ShortPrefix.size() + Alias.size() &&
         Token.substr(0, ShortPrefix.size()) == ShortPrefix &&
         Token.substr(ShortPrefix.size()) == Alias;
}

std::string Flag::getDisplayName() const {
  std::string Result(LongPrefix);
  Result += Name;
  if (hasAlias()) {
    Result += ", ";
    Result += ShortPrefix;
    Result += Alias;
  }
  return Result;
}

std::string Flag::getHelpText() const {
  std::string Result = Description;
  if (isRequired())
    return Result;

  if (!Result.empty())
    Result.push_back(' ');
  Result += "(";
  Result += quote(DefaultValue == EmptyValue ? std::string_view()
                                             : std::string_view(DefaultValue));
  Result += ")";
  return Result;
}

std::string Flag::str() const {
  return getDisplayName() + "\t" + getHelpText();
}

Error Flag::check() const {
  if (Name.empty())
    return Error(ErrorCode::InvalidName, "missing name of flag");

  for (char32_t C : decodeUTF8(Name))
    if (!isNameChar(C))
      return Error(ErrorCode::InvalidCharacter,
                   "invalid character in flag name: " + quoteChar(C), Name);

  if (hasAlias()) {
    std::u32string Chars = decodeUTF8(Alias);
    if (Chars.size() != 1 || !isAliasChar(Chars[0]))
      return Error(ErrorCode::InvalidCharacter,
                   "flag alias is an invalid character: " +
                       (Chars.size() == 1 ? quoteChar(Chars[0])
                                          : quote(Alias)),
                   Alias);
  }

  return Error::success();
}

//===----------------------------------------------------------------------===//
// FlagSet implementation
//

const Flag *FlagSet::lookup(std::string_view Token) const {
  for (const Flag &F : Flags)
    if (F.matches(Token))
      return &F;
  return nullptr;
}

Error FlagSet::check() const {
  // Names and aliases share one namespace.
  std::set<std::string, std::less<>> Seen;
  for (const Flag &F : Flags) {
    if (Error Err = F.check())
      return Err;

    if (!Seen.insert(F.Name).second)
      return Error(ErrorCode::DuplicateFlag,
                   "duplicate flag name or alias: " + quote(F.Name), F.Name);

    if (F.hasAlias() && !Seen.insert(F.Alias).second)
      return Error(ErrorCode::DuplicateFlag,
                   "duplicate flag name or alias: " +
                       quoteChar(decodeUTF8(F.Alias).front()),
                   F.Alias);
  }
  return Error::success();
}

Expected<ParsedInvocation> FlagSet::parse(const ArgList &Tokens) const {
  ParsedInvocation Result;

  for (size_t I = 0, E = Tokens.size(); I != E; ++I) {
    const std::string &Token = Tokens[I];
    const Flag *F = lookup(Token);
    if (!F) {
      Result.Arguments.push_back(Token);
      continue;
    }

    if (I + 1 == E)
      return Error(ErrorCode::MissingFlagValue,
                   "no corresponding value for flag: " + quote(Token), Token);

    // The value is taken verbatim, even if it looks like a flag.
    Result.Flags[F->Name] = Tokens[++I];
  }

  for (const Flag &F : Flags) {
    if (Result.Flags.count(F.Name))
      continue;

    if (F.isRequired())
      return Error(ErrorCode::MissingRequiredFlag,
                   "no given or default value for flag: " + quote(F.Name),
                   F.Name);

    Result.Flags[F.Name] = F.DefaultValue == EmptyValue ? "" : F.DefaultValue;
  }

  return Result;
}

std::string FlagSet::getHelp(std::string_view Indent) const {
  std::vector<ColumnRow> Rows;
  Rows.reserve(Flags.size());
  for (const Flag &F : Flags)
    Rows.emplace_back(F.getDisplayName(), F.getHelpText());
  return formatColumns(Rows, Indent);
}
