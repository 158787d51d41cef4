//===- cmdkit/Action.h - Actions and error handlers -------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#ifndef CMDKIT_ACTION_H
#define CMDKIT_ACTION_H

#include "cmdkit/Error.h"
#include "cmdkit/Flag.h"

#include <functional>
#include <iostream>
#include <string>
#include <string_view>

namespace cmdkit {

/// Stream helpers.
inline std::ostream &outs() { return std::cout; }
inline std::ostream &errs() { return std::cerr; }

/// Function run with the parsed flags and arguments of an invocation.
using ActionTy =
    std::function<Error(const FlagMap &Flags, const ArgList &Args)>;

/// Function told about an error. The stock handlers exit the process.
using ErrorHandlerTy =
    std::function<void(std::string_view ProgramName, const Error &Err)>;

enum ExitCode {
  ExitSuccess = 0,
  ExitActionFailure = 1,
  ExitInputFailure = 2,
  ExitSchemaFailure = 3
};

/// Returns the exit code for errors of kind \p Kind.
ExitCode getExitCode(ErrorKind Kind);

/// Does nothing. Used for commands that declare no action.
Error noopAction(const FlagMap &Flags, const ArgList &Args);

/// Fails, telling the user to use "--help". Used when the program declares
/// no top-level action.
Error helpAction(const FlagMap &Flags, const ArgList &Args);

/// Formats \p Message as "ProgramName: Message". The prefix is left out if
/// the message already carries it or there is no program name.
std::string formatDiagnostic(std::string_view ProgramName,
                             std::string_view Message);

/// Returns a handler that writes the diagnostic to \p Errs, or errs() when
/// \p Errs is null, and then exits with \p Code.
ErrorHandlerTy exitingErrorHandler(ExitCode Code, std::ostream *Errs = nullptr);

} // end namespace cmdkit

#endif // CMDKIT_ACTION_H
