//===-- Greet.cpp - Example cmdkit program --------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A small program built with cmdkit:
//
//   greet --name Ada               prints "Hello, Ada!"
//   greet shout -m hi there        prints "HI THERE"
//   greet repeat -n 3 -w hey       prints "hey" three times
//   greet --help, greet shout -h   print help text
//
//===----------------------------------------------------------------------===//

#include "cmdkit/Program.h"

#include <cctype>
#include <cstdlib>
#include <string>

using namespace cmdkit;

static Error greet(const FlagMap &Flags, const ArgList &Args) {
  outs() << Flags.at("greeting") << ", " << Flags.at("name") << "!\n";
  for (const std::string &Arg : Args)
    outs() << "ignored argument: " << Arg << '\n';
  return Error::success();
}

static Error shout(const FlagMap &Flags, const ArgList &Args) {
  std::string Text = Flags.at("message");
  for (const std::string &Arg : Args) {
    if (!Text.empty())
      Text += ' ';
    Text += Arg;
  }
  for (char &C : Text)
    C = static_cast<char>(std::toupper(static_cast<unsigned char>(C)));
  outs() << Text << '\n';
  return Error::success();
}

static Error repeat(const FlagMap &Flags, const ArgList & /*Args*/) {
  const std::string &Count = Flags.at("count");
  char *End = nullptr;
  long N = std::strtol(Count.c_str(), &End, 10);
  if (Count.empty() || *End != '\0' || N < 0)
    return createActionError("invalid count: " + Count);
  for (long I = 0; I < N; ++I)
    outs() << Flags.at("word") << '\n';
  return Error::success();
}

int main(int argc, char **argv) {
  Program P;
  P.Name = "greet";
  P.Tagline = "say things";
  P.Version = "0.1.0";
  P.Description = "Greets people, loudly or repeatedly.";
  P.Authors = {{"cmdkit developers", "cmdkit@example.org"}};
  P.Flags.add({"name", "n", "NAME", "who to greet", "World"})
      .add({"greeting", "g", "WORD", "greeting to use", "Hello"});
  P.Action = greet;

  Command Shout;
  Shout.Names = {"shout", "s"};
  Shout.Description = "Print a message in capitals";
  Shout.Usage = "[--message TEXT] [words...]";
  Shout.Flags.add({"message", "m", "TEXT", "message to print", EmptyValue});
  Shout.Action = shout;
  P.Commands.add(std::move(Shout));

  Command Repeat;
  Repeat.Names = {"repeat", "r"};
  Repeat.Description = "Print a word several times";
  Repeat.Flags.add({"count", "n", "N", "how many times", "2"})
      .add({"word", "w", "WORD", "the word to print", ""});
  Repeat.Action = repeat;
  P.Commands.add(std::move(Repeat));

  return P.run(argc, argv);
}
