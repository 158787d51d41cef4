//===- cmdkit/Error.h - Error values ----------------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Errors are plain values. Schema errors come from check(), input errors from
// parse() and action errors from the application's handlers; Program::run
// routes each kind to its own handler.
//
//===----------------------------------------------------------------------===//

#ifndef CMDKIT_ERROR_H
#define CMDKIT_ERROR_H

#include <cassert>
#include <optional>
#include <string>
#include <utility>

namespace cmdkit {

enum class ErrorKind {
  None,   // Not an error.
  Schema, // The program's declarations are invalid.
  Input,  // The user's arguments are invalid.
  Action  // An action handler failed.
};

enum class ErrorCode {
  Success = 0,

  // Schema errors.
  InvalidName,
  InvalidCharacter,
  DuplicateFlag,
  MissingCommandName,
  DuplicateCommandName,

  // Input errors.
  MissingFlagValue,
  MissingRequiredFlag,
  MissingCommand,

  // Action errors.
  ActionFailed
};

/// Returns the kind an error code belongs to.
ErrorKind getErrorKind(ErrorCode Code);

/// An error value. Converts to true when it holds a failure.
///
/// Subject names the flag, alias, command or token the error is about, when
/// there is one.
struct Error {
  ErrorCode Code = ErrorCode::Success;
  std::string Message;
  std::string Subject;

  Error() = default;
  Error(ErrorCode Code, std::string Message, std::string Subject = "")
      : Code(Code), Message(std::move(Message)), Subject(std::move(Subject)) {
    assert(Code != ErrorCode::Success && "use Error::success()");
  }
  Error(Error &&Other) noexcept
      : Code(Other.Code), Message(std::move(Other.Message)),
        Subject(std::move(Other.Subject)) {
    Other.Code = ErrorCode::Success;
  }
  Error &operator=(Error &&Other) noexcept {
    Code = Other.Code;
    Message = std::move(Other.Message);
    Subject = std::move(Other.Subject);
    Other.Code = ErrorCode::Success;
    return *this;
  }

  static Error success() { return Error(); }
  explicit operator bool() const { return Code != ErrorCode::Success; }

  ErrorKind getKind() const { return getErrorKind(Code); }
};

inline std::string toString(Error E) { return std::move(E.Message); }

/// Creates the error an action handler returns on failure.
inline Error createActionError(std::string Msg) {
  return Error(ErrorCode::ActionFailed, std::move(Msg));
}

/// Holds either a value or the error that prevented computing it.
template <typename T> class Expected {
  std::optional<T> Val;
  Error Err;

public:
  Expected(T V) : Val(std::move(V)) {}
  /// \p E should be a failure. Success is replaced by an ActionFailed error
  /// so that an Expected without a value always carries an error.
  Expected(Error E) : Err(std::move(E)) {
    if (!Err)
      Err = Error(ErrorCode::ActionFailed, "no value and no error");
  }

  explicit operator bool() const { return Val.has_value(); }
  T &get() { return *Val; }
  const T &get() const { return *Val; }
  T &operator*() { return *Val; }
  const T &operator*() const { return *Val; }
  T *operator->() { return &*Val; }
  const T *operator->() const { return &*Val; }

  /// Moves the error out. Only meaningful when the Expected holds no value.
  Error takeError() { return std::move(Err); }
};

} // end namespace cmdkit

#endif // CMDKIT_ERROR_H
