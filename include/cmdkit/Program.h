//===- cmdkit/Program.h - Top-level command line program --------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A Program describes a command line interface: global flags, subcommands,
// a top-level action, and the text shown by "--help" and "--version".
//
//   cmdkit::Program P;
//   P.Name = "tool";
//   P.Version = "1.0.0";
//   P.Commands.add({{"build", "b"}, "Build the project", "", {}, Build});
//   return P.run(argc, argv);
//
// run() resolves an invocation in this order:
//
//   1. "-h"/"--help" or "-v"/"--version" anywhere print help or version.
//   2. The declared flags and commands are validated.
//   3. A first token naming a command runs that command with the rest.
//   4. Otherwise all tokens are parsed against the global flags and the
//      top-level action runs.
//
// Errors are routed by kind to ActionErrorHandler, ParseErrorHandler or
// SetupErrorHandler. The stock handlers print the error and exit.
//
//===----------------------------------------------------------------------===//

#ifndef CMDKIT_PROGRAM_H
#define CMDKIT_PROGRAM_H

#include "cmdkit/Action.h"
#include "cmdkit/Command.h"
#include "cmdkit/Error.h"
#include "cmdkit/Flag.h"

#include <iosfwd>
#include <string>
#include <vector>

namespace cmdkit {

struct Author {
  std::string Name;
  std::string Email;

  /// "Name <Email>".
  std::string str() const;
};

class Program {
public:
  std::string Name;    // Required.
  std::string Tagline; // Shown after the name in help.
  std::string Version; // Required.
  std::string Description;
  std::vector<Author> Authors;
  std::string Usage; // Replaces the default usage line if non-empty.
  FlagSet Flags;     // Global flags.
  CommandSet Commands;
  ActionTy Action; // Runs when no command is named. May be empty.

  // Where help and version text are written.
  std::ostream *Out = &outs();

  // Runs for commands without an action.
  ActionTy CommandFallback = noopAction;

  // Runs when the program has no action.
  ActionTy TopLevelFallback = helpAction;

  ErrorHandlerTy ActionErrorHandler = exitingErrorHandler(ExitActionFailure);
  ErrorHandlerTy ParseErrorHandler = exitingErrorHandler(ExitInputFailure);
  ErrorHandlerTy SetupErrorHandler = exitingErrorHandler(ExitSchemaFailure);

  /// Validates the global flags and the commands.
  Error check() const;

  /// Runs the program on \p Tokens, which exclude the program name. Returns
  /// the exit code for the outcome once the error handler, if one was
  /// called, returns.
  int run(const ArgList &Tokens) const;

  /// Runs the program on argv[1] through argv[argc - 1].
  int run(int argc, const char *const *argv) const;

  std::string getHelp() const;

  /// "Name Version".
  std::string getVersion() const;

private:
  Error dispatch(const ArgList &Tokens) const;
  int report(const Error &Err) const;
};

} // end namespace cmdkit

#endif // CMDKIT_PROGRAM_H
