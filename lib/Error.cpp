//===-- Error.cpp - Error values ------------------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "cmdkit/Error.h"

using namespace cmdkit;

ErrorKind cmdkit::getErrorKind(ErrorCode Code) {
  switch (Code) {
  case ErrorCode::Success:
    return ErrorKind::None;
  case ErrorCode::InvalidName:
  case ErrorCode::InvalidCharacter:
  case ErrorCode::DuplicateFlag:
  case ErrorCode::MissingCommandName:
  case ErrorCode::DuplicateCommandName:
    return ErrorKind::Schema;
  case ErrorCode::MissingFlagValue:
  case ErrorCode::MissingRequiredFlag:
  case ErrorCode::MissingCommand:
    return ErrorKind::Input;
  case ErrorCode::ActionFailed:
    return ErrorKind::Action;
  }
  return ErrorKind::Action;
}
