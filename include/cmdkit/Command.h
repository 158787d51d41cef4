//===- cmdkit/Command.h - Subcommands ---------------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#ifndef CMDKIT_COMMAND_H
#define CMDKIT_COMMAND_H

#include "cmdkit/Action.h"
#include "cmdkit/Error.h"
#include "cmdkit/Flag.h"

#include <cassert>
#include <cstddef>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cmdkit {

/// Returns true for "-h" and "--help".
bool isHelpToken(std::string_view Token);

/// Returns true for "-v" and "--version".
bool isVersionToken(std::string_view Token);

/// A subcommand. It owns its flags; global flags are not parsed for it.
struct Command {
  std::vector<std::string> Names; // Canonical name first, then aliases.
  std::string Description;
  std::string Usage; // Replaces the default usage line if non-empty.
  FlagSet Flags;
  ActionTy Action; // May be empty.

  /// Returns the canonical name. The command must have at least one name.
  const std::string &getName() const {
    assert(!Names.empty() && "command has no name");
    return Names.front();
  }

  bool hasName(std::string_view Name) const;

  /// All names joined by ", ".
  std::string getDisplayName() const;

  /// Validates the names and the flags.
  Error check() const;

  std::string getHelp(std::string_view ProgramName) const;

  /// Runs the command with the tokens that followed its name. A leading
  /// help token writes the help text to \p OS instead. \p Fallback runs if
  /// the command has no action.
  Error run(std::string_view ProgramName, const ArgList &Tokens,
            std::ostream &OS, const ActionTy &Fallback = noopAction) const;
};

/// An ordered list of commands with unique names.
class CommandSet {
  std::vector<Command> Commands;

public:
  using const_iterator = std::vector<Command>::const_iterator;

  CommandSet() = default;
  CommandSet(std::initializer_list<Command> IL) : Commands(IL) {}

  CommandSet &add(Command C) {
    Commands.push_back(std::move(C));
    return *this;
  }

  size_t size() const { return Commands.size(); }
  bool empty() const { return Commands.empty(); }
  const_iterator begin() const { return Commands.begin(); }
  const_iterator end() const { return Commands.end(); }

  /// Returns the command with \p Name as its name or one of its aliases, or
  /// nullptr.
  const Command *lookup(std::string_view Name) const;

  /// Validates every command, then checks that no name is used twice across
  /// all commands.
  Error check() const;

  /// One line per command with its names and description.
  std::string getHelp(std::string_view Indent) const;
};

} // end namespace cmdkit

#endif // CMDKIT_COMMAND_H
