//===- cmdkit/Flag.h - Command line flags -----------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A flag is a named string option given as two tokens: "--name value" or,
// when the flag has an alias, "-a value". Tokens that match no declared flag
// are positional arguments, even when they start with a dash.
//
//===----------------------------------------------------------------------===//

#ifndef CMDKIT_FLAG_H
#define CMDKIT_FLAG_H

#include "cmdkit/Error.h"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cmdkit {

/// Flag values keyed by canonical flag name.
using FlagMap = std::map<std::string, std::string, std::less<>>;

/// Positional arguments, in the order they were given.
using ArgList = std::vector<std::string>;

/// Default value of a flag that is optional and empty when not given. An
/// empty DefaultValue makes the flag mandatory instead.
inline const std::string EmptyValue("\0", 1);

/// The result of parsing a token list against a FlagSet.
struct ParsedInvocation {
  FlagMap Flags;
  ArgList Arguments;
};

struct Flag {
  std::string Name;         // Given as "--Name".
  std::string Alias;        // Given as "-Alias". Empty if there is none.
  std::string ValueKind;    // What the value is, e.g. "FILENAME".
  std::string Description;  // Shown in help.
  std::string DefaultValue; // Empty if the flag is mandatory.

  bool hasAlias() const { return !Alias.empty(); }
  bool isRequired() const { return DefaultValue.empty(); }

  /// Returns true if \p Token names this flag by name or alias.
  bool matches(std::string_view Token) const;

  /// "--name" or "--name, -a".
  std::string getDisplayName() const;

  /// Description followed by the quoted default, if the flag has one.
  std::string getHelpText() const;

  /// Display name and help text separated by a tab.
  std::string str() const;

  /// Validates the name and alias.
  Error check() const;
};

/// An ordered list of flags. The order only affects help output.
class FlagSet {
  std::vector<Flag> Flags;

public:
  using const_iterator = std::vector<Flag>::const_iterator;

  FlagSet() = default;
  FlagSet(std::initializer_list<Flag> IL) : Flags(IL) {}

  FlagSet &add(Flag F) {
    Flags.push_back(std::move(F));
    return *this;
  }

  size_t size() const { return Flags.size(); }
  bool empty() const { return Flags.empty(); }
  const_iterator begin() const { return Flags.begin(); }
  const_iterator end() const { return Flags.end(); }

  /// Returns the flag \p Token refers to, or nullptr.
  const Flag *lookup(std::string_view Token) const;

  /// Validates every flag and checks that no name or alias is used twice.
  Error check() const;

  /// Splits \p Tokens into flag values and positional arguments, then fills
  /// in defaults. Fails if a flag is last with no value after it, or if a
  /// mandatory flag was not given.
  Expected<ParsedInvocation> parse(const ArgList &Tokens) const;

  /// One line per flag, with the help text aligned after the widest name.
  std::string getHelp(std::string_view Indent) const;
};

} // end namespace cmdkit

#endif // CMDKIT_FLAG_H
