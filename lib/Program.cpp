//===-- Program.cpp - Top-level command line program ----------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "cmdkit/Program.h"
#include "cmdkit/StringExtras.h"

#include <ostream>
#include <sstream>

using namespace cmdkit;

static const char DefaultProgramUsage[] =
    "[global flags...] [command] [flags and values...] [arguments...]";

static void printSectionTitle(std::ostream &OS, const char *Title,
                              size_t Count) {
  OS << Title << (Count > 1 ? "S:\n" : ":\n");
}

std::string Author::str() const { return Name + " <" + Email + ">"; }

Error Program::check() const {
  if (Error Err = Flags.check())
    return Err;
  return Commands.check();
}

int Program::run(int argc, const char *const *argv) const {
  ArgList Tokens;
  for (int I = 1; I < argc; ++I)
    Tokens.emplace_back(argv[I]);
  return run(Tokens);
}

int Program::run(const ArgList &Tokens) const {
  // Help and version win wherever they appear.
  for (const std::string &Token : Tokens) {
    if (isHelpToken(Token)) {
      const Command *C = Commands.lookup(Tokens.front());
      *Out << (C ? C->getHelp(Name) : getHelp()) << '\n';
      return ExitSuccess;
    }
    if (isVersionToken(Token)) {
      *Out << getVersion() << '\n';
      return ExitSuccess;
    }
  }

  if (Error Err = check())
    return report(Err);

  return report(dispatch(Tokens));
}

Error Program::dispatch(const ArgList &Tokens) const {
  if (!Tokens.empty())
    if (const Command *C = Commands.lookup(Tokens.front()))
      return C->run(Name, ArgList(Tokens.begin() + 1, Tokens.end()), *Out,
                    CommandFallback);

  Expected<ParsedInvocation> Parsed = Flags.parse(Tokens);
  if (!Parsed)
    return Parsed.takeError();

  const ActionTy &Handler = Action ? Action : TopLevelFallback;
  if (!Handler)
    return Error::success();
  return Handler(Parsed->Flags, Parsed->Arguments);
}

int Program::report(const Error &Err) const {
  if (!Err)
    return ExitSuccess;

  const ErrorHandlerTy *Handler = &ActionErrorHandler;
  switch (Err.getKind()) {
  case ErrorKind::Schema:
    Handler = &SetupErrorHandler;
    break;
  case ErrorKind::Input:
    Handler = &ParseErrorHandler;
    break;
  case ErrorKind::None:
  case ErrorKind::Action:
    break;
  }

  if (*Handler)
    (*Handler)(Name, Err);
  return getExitCode(Err.getKind());
}

std::string Program::getVersion() const { return Name + " " + Version; }

std::string Program::getHelp() const {
  std::ostringstream OS;

  OS << "NAME:\n";
  OS << "\t" << Name;
  if (!Tagline.empty())
    OS << " - " << Tagline;
  OS << "\n\n";

  OS << "VERSION:\n";
  OS << "\t" << Version << "\n\n";

  if (!Description.empty()) {
    OS << "DESCRIPTION:\n";
    OS << "\t" << Description << "\n\n";
  }

  if (!Authors.empty()) {
    printSectionTitle(OS, "AUTHOR", Authors.size());
    for (const Author &A : Authors)
      OS << "\t" << A.str() << "\n";
    OS << "\n";
  }

  OS << "USAGE:\n";
  OS << "\t" << Name << " "
     << (Usage.empty() ? std::string(DefaultProgramUsage) : Usage) << "\n\n";

  OS << "GLOBAL FLAGS:\n";
  OS << formatColumns(
      {{"--help, -h", "show help (with optional subcommand) and exit"},
       {"--version, -v", "show version and exit"}},
      "\t");
  OS << "\n";

  if (!Commands.empty()) {
    printSectionTitle(OS, "COMMAND", Commands.size());
    OS << Commands.getHelp("\t") << "\n";
  }

  if (!Flags.empty()) {
    printSectionTitle(OS, "FLAG", Flags.size());
    OS << Flags.getHelp("\t") << "\n";
  }

  return std::string(trimTrailingNewlines(OS.str()));
}
