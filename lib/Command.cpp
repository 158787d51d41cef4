//===-- Command.cpp - Subcommands -----------------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "cmdkit/Command.h"
#include "cmdkit/StringExtras.h"
#include "cmdkit/Unicode.h"

#include <functional>
#include <ostream>
#include <set>
#include <sstream>

using namespace cmdkit;

static const char DefaultCommandUsage[] =
    "[flags and values...] [arguments...]";

bool cmdkit::isHelpToken(std::string_view Token) {
  return Token == "-h" || Token == "--help";
}

bool cmdkit::isVersionToken(std::string_view Token) {
  return Token == "-v" || Token == "--version";
}

//===----------------------------------------------------------------------===//
// Command implementation
//

bool Command::hasName(std::string_view Name) const {
  for (const std::string &N : Names)
    if (N == Name)
      return true;
  return false;
}

std::string Command::getDisplayName() const { return join(Names, ", "); }

Error Command::check() const {
  if (Names.empty())
    return Error(ErrorCode::MissingCommandName, "missing name of command");

  for (const std::string &Name : Names)
    for (char32_t C : decodeUTF8(Name))
      if (!isNameChar(C))
        return Error(ErrorCode::InvalidCharacter,
                     "invalid character in command name: " + quoteChar(C) +
                         " in " + quote(Name),
                     Name);

  return Flags.check();
}

std::string Command::getHelp(std::string_view ProgramName) const {
  std::ostringstream OS;

  OS << "NAME:\n";
  OS << "\t" << ProgramName << " " << getName() << "\n\n";

  if (!Description.empty()) {
    OS << "DESCRIPTION:\n";
    OS << "\t" << Description << "\n\n";
  }

  OS << "USAGE:\n";
  OS << "\t" << ProgramName << " " << getName() << " "
     << (Usage.empty() ? std::string(DefaultCommandUsage) : Usage) << "\n\n";

  if (!Flags.empty()) {
    OS << (Flags.size() > 1 ? "FLAGS:\n" : "FLAG:\n");
    OS << Flags.getHelp("\t") << "\n";
  }

  return std::string(trimTrailingNewlines(OS.str()));
}

Error Command::run(std::string_view ProgramName, const ArgList &Tokens,
                   std::ostream &OS, const ActionTy &Fallback) const {
  if (!Tokens.empty() && isHelpToken(Tokens.front())) {
    OS << getHelp(ProgramName) << '\n';
    return Error::success();
  }

  Expected<ParsedInvocation> Parsed = Flags.parse(Tokens);
  if (!Parsed)
    return Parsed.takeError();

  const ActionTy &Handler = Action ? Action : Fallback;
  if (!Handler)
    return Error::success();
  return Handler(Parsed->Flags, Parsed->Arguments);
}

//===----------------------------------------------------------------------===//
// CommandSet implementation
//

const Command *CommandSet::lookup(std::string_view Name) const {
  for (const Command &C : Commands)
    if (C.hasName(Name))
      return &C;
  return nullptr;
}

Error CommandSet::check() const {
  for (const Command &C : Commands)
    if (Error Err = C.check())
      return Err;

  std::set<std::string, std::less<>> Seen;
  for (const Command &C : Commands)
    for (const std::string &Name : C.Names)
      if (!Seen.insert(Name).second)
        return Error(ErrorCode::DuplicateCommandName,
                     "duplicate command name " + quote(Name), Name);

  return Error::success();
}

std::string CommandSet::getHelp(std::string_view Indent) const {
  std::vector<ColumnRow> Rows;
  Rows.reserve(Commands.size());
  for (const Command &C : Commands)
    Rows.emplace_back(C.getDisplayName(), C.Description);
  return formatColumns(Rows, Indent);
}
