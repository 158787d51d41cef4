//===-- Action.cpp - Actions and error handlers ---------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "cmdkit/Action.h"

#include <cstdlib>

using namespace cmdkit;

ExitCode cmdkit::getExitCode(ErrorKind Kind) {
  switch (Kind) {
  case ErrorKind::None:
    return ExitSuccess;
  case ErrorKind::Schema:
    return ExitSchemaFailure;
  case ErrorKind::Input:
    return ExitInputFailure;
  case ErrorKind::Action:
    return ExitActionFailure;
  }
  return ExitActionFailure;
}

Error cmdkit::noopAction(const FlagMap & /*Flags*/, const ArgList & /*Args*/) {
  return Error::success();
}

Error cmdkit::helpAction(const FlagMap & /*Flags*/, const ArgList & /*Args*/) {
  return Error(ErrorCode::MissingCommand, "use the \"--help\" global flag");
}

std::string cmdkit::formatDiagnostic(std::string_view ProgramName,
                                     std::string_view Message) {
  if (ProgramName.empty())
    return std::string(Message);

  if (Message.size() > ProgramName.size() &&
      Message.substr(0, ProgramName.size()) == ProgramName &&
      Message[ProgramName.size()] == ':')
    return std::string(Message);

  std::string Result(ProgramName);
  Result += ": ";
  Result += Message;
  return Result;
}

ErrorHandlerTy cmdkit::exitingErrorHandler(ExitCode Code, std::ostream *Errs) {
  return [Code, Errs](std::string_view ProgramName, const Error &Err) {
    std::ostream &OS = Errs ? *Errs : errs();
    OS << formatDiagnostic(ProgramName, Err.Message) << '\n';
    OS.flush();
    std::exit(Code);
  };
}
