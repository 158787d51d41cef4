//===- cmdkit/test/ProgramTest.cpp - Program dispatch tests ---------------===//
//
//===----------------------------------------------------------------------===//

#include "cmdkit/Program.h"

#include <sstream>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace cmdkit;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Pair;

namespace {

struct Invocation {
  std::string Name;
  FlagMap Flags;
  ArgList Args;
};

class ProgramTest : public ::testing::Test {
protected:
  Program P;
  std::ostringstream Out;
  std::vector<Invocation> Calls;
  std::vector<std::string> ActionErrors;
  std::vector<std::string> ParseErrors;
  std::vector<std::string> SetupErrors;

  void SetUp() override {
    P.Name = "tool";
    P.Version = "1.2.0";
    P.Out = &Out;
    P.ActionErrorHandler = record(ActionErrors);
    P.ParseErrorHandler = record(ParseErrors);
    P.SetupErrorHandler = record(SetupErrors);
  }

  static ErrorHandlerTy record(std::vector<std::string> &Log) {
    return [&Log](std::string_view ProgramName, const Error &Err) {
      Log.push_back(formatDiagnostic(ProgramName, Err.Message));
    };
  }

  ActionTy recordAs(std::string Name) {
    return [this, Name](const FlagMap &Flags, const ArgList &Args) {
      Calls.push_back({Name, Flags, Args});
      return Error::success();
    };
  }

  void addBuildCommand() {
    Command Build;
    Build.Names = {"build", "b"};
    Build.Description = "Build it";
    Build.Flags.add({"jobs", "j", "N", "parallel jobs", "4"});
    Build.Action = recordAs("build");
    P.Commands.add(std::move(Build));
  }
};

//===----------------------------------------------------------------------===//
// Help and version
//===----------------------------------------------------------------------===//

TEST_F(ProgramTest, VersionAnywhere) {
  P.Action = recordAs("main");
  EXPECT_EQ(ExitSuccess, P.run(ArgList{"-v"}));
  EXPECT_EQ(ExitSuccess, P.run(ArgList{"a", "b", "--version"}));
  EXPECT_EQ("tool 1.2.0\ntool 1.2.0\n", Out.str());
  EXPECT_THAT(Calls, IsEmpty());
}

TEST_F(ProgramTest, HelpAnywhereSuppressesDispatch) {
  P.Action = recordAs("main");
  EXPECT_EQ(ExitSuccess, P.run(ArgList{"x", "--unknown", "-h"}));
  EXPECT_EQ(P.getHelp() + "\n", Out.str());
  EXPECT_THAT(Calls, IsEmpty());
}

TEST_F(ProgramTest, HelpAfterCommandNameShowsCommandHelp) {
  addBuildCommand();
  EXPECT_EQ(ExitSuccess, P.run(ArgList{"build", "--help"}));
  EXPECT_EQ(ExitSuccess, P.run(ArgList{"b", "x", "-h"}));
  std::string BuildHelp = P.Commands.lookup("build")->getHelp("tool");
  EXPECT_EQ(BuildHelp + "\n" + BuildHelp + "\n", Out.str());
  EXPECT_THAT(Calls, IsEmpty());
}

TEST_F(ProgramTest, HelpWinsOverInvalidDeclarations) {
  P.Flags.add({"out", "o", "", "", "a"}).add({"other", "o", "", "", "b"});
  EXPECT_EQ(ExitSuccess, P.run(ArgList{"--help"}));
  EXPECT_THAT(SetupErrors, IsEmpty());
}

TEST_F(ProgramTest, VersionString) { EXPECT_EQ("tool 1.2.0", P.getVersion()); }

TEST_F(ProgramTest, HelpMinimal) {
  EXPECT_EQ("NAME:\n"
            "\ttool\n"
            "\n"
            "VERSION:\n"
            "\t1.2.0\n"
            "\n"
            "USAGE:\n"
            "\ttool [global flags...] [command] [flags and values...] "
            "[arguments...]\n"
            "\n"
            "GLOBAL FLAGS:\n"
            "\t--help, -h   \tshow help (with optional subcommand) and exit\n"
            "\t--version, -v\tshow version and exit",
            P.getHelp());
}

TEST_F(ProgramTest, HelpFull) {
  P.Tagline = "does things";
  P.Description = "A tool.";
  P.Authors = {{"Ada", "ada@example.com"}};
  P.Flags.add({"config", "c", "PATH", "config file", "tool.toml"});
  addBuildCommand();
  Command Run;
  Run.Names = {"run"};
  Run.Description = "Run it";
  P.Commands.add(std::move(Run));

  EXPECT_EQ("NAME:\n"
            "\ttool - does things\n"
            "\n"
            "VERSION:\n"
            "\t1.2.0\n"
            "\n"
            "DESCRIPTION:\n"
            "\tA tool.\n"
            "\n"
            "AUTHOR:\n"
            "\tAda <ada@example.com>\n"
            "\n"
            "USAGE:\n"
            "\ttool [global flags...] [command] [flags and values...] "
            "[arguments...]\n"
            "\n"
            "GLOBAL FLAGS:\n"
            "\t--help, -h   \tshow help (with optional subcommand) and exit\n"
            "\t--version, -v\tshow version and exit\n"
            "\n"
            "COMMANDS:\n"
            "\tbuild, b\tBuild it\n"
            "\trun     \tRun it\n"
            "\n"
            "FLAG:\n"
            "\t--config, -c\tconfig file (\"tool.toml\")",
            P.getHelp());
}

TEST_F(ProgramTest, HelpPluralAuthorsAndCustomUsage) {
  P.Authors = {{"Ada", "ada@example.com"}, {"Bob", "bob@example.com"}};
  P.Usage = "[options] FILE";
  std::string Help = P.getHelp();
  EXPECT_THAT(Help, ::testing::HasSubstr("AUTHORS:\n"
                                         "\tAda <ada@example.com>\n"
                                         "\tBob <bob@example.com>\n\n"));
  EXPECT_THAT(Help, ::testing::HasSubstr("USAGE:\n\ttool [options] FILE\n"));
}

//===----------------------------------------------------------------------===//
// Dispatch
//===----------------------------------------------------------------------===//

TEST_F(ProgramTest, CommandReceivesRemainingTokens) {
  P.Action = recordAs("main");
  // A mandatory global flag must not affect command dispatch.
  P.Flags.add({"config", "c", "", "", ""});
  addBuildCommand();

  EXPECT_EQ(ExitSuccess, P.run(ArgList{"b", "--config", "x", "-j", "8"}));
  ASSERT_EQ(1u, Calls.size());
  EXPECT_EQ("build", Calls[0].Name);
  EXPECT_THAT(Calls[0].Flags, ElementsAre(Pair("jobs", "8")));
  EXPECT_THAT(Calls[0].Args, ElementsAre("--config", "x"));
}

TEST_F(ProgramTest, CommandNameOnlyMatchesFirstToken) {
  P.Action = recordAs("main");
  addBuildCommand();

  EXPECT_EQ(ExitSuccess, P.run(ArgList{"x", "build"}));
  ASSERT_EQ(1u, Calls.size());
  EXPECT_EQ("main", Calls[0].Name);
  EXPECT_THAT(Calls[0].Args, ElementsAre("x", "build"));
}

TEST_F(ProgramTest, TopLevelActionGetsGlobalFlags) {
  P.Action = recordAs("main");
  P.Flags.add({"config", "c", "", "", "tool.toml"});
  P.Flags.add({"verbose", "V", "", "", EmptyValue});

  EXPECT_EQ(ExitSuccess, P.run(ArgList{"-c", "a.toml", "pos"}));
  EXPECT_EQ(ExitSuccess, P.run(ArgList{}));
  ASSERT_EQ(2u, Calls.size());
  EXPECT_THAT(Calls[0].Flags, ElementsAre(Pair("config", "a.toml"),
                                          Pair("verbose", "")));
  EXPECT_THAT(Calls[0].Args, ElementsAre("pos"));
  EXPECT_THAT(Calls[1].Flags, ElementsAre(Pair("config", "tool.toml"),
                                          Pair("verbose", "")));
  EXPECT_THAT(Calls[1].Args, IsEmpty());
}

TEST_F(ProgramTest, RunDropsProgramNameFromArgv) {
  addBuildCommand();
  const char *Argv[] = {"/usr/bin/tool", "build", "x"};
  EXPECT_EQ(ExitSuccess, P.run(3, Argv));
  ASSERT_EQ(1u, Calls.size());
  EXPECT_EQ("build", Calls[0].Name);
  EXPECT_THAT(Calls[0].Args, ElementsAre("x"));
}

TEST_F(ProgramTest, CommandWithoutActionUsesFallback) {
  Command Clean;
  Clean.Names = {"clean"};
  P.Commands.add(std::move(Clean));
  EXPECT_EQ(ExitSuccess, P.run(ArgList{"clean", "all"}));

  P.CommandFallback = recordAs("fallback");
  EXPECT_EQ(ExitSuccess, P.run(ArgList{"clean", "all"}));
  ASSERT_EQ(1u, Calls.size());
  EXPECT_EQ("fallback", Calls[0].Name);
  EXPECT_THAT(Calls[0].Args, ElementsAre("all"));
}

TEST_F(ProgramTest, NoActionTellsUserToUseHelp) {
  EXPECT_EQ(ExitInputFailure, P.run(ArgList{"x"}));
  EXPECT_THAT(ParseErrors, ElementsAre("tool: use the \"--help\" global flag"));
  EXPECT_THAT(ActionErrors, IsEmpty());
}

TEST_F(ProgramTest, CustomTopLevelFallback) {
  P.TopLevelFallback = recordAs("fallback");
  EXPECT_EQ(ExitSuccess, P.run(ArgList{"x"}));
  ASSERT_EQ(1u, Calls.size());
  EXPECT_EQ("fallback", Calls[0].Name);
}

//===----------------------------------------------------------------------===//
// Error routing
//===----------------------------------------------------------------------===//

TEST_F(ProgramTest, SchemaErrorGoesToSetupHandler) {
  P.Action = recordAs("main");
  P.Flags.add({"out", "o", "", "", "a"}).add({"other", "o", "", "", "b"});
  EXPECT_EQ(ExitSchemaFailure, P.run(ArgList{}));
  EXPECT_THAT(SetupErrors,
              ElementsAre("tool: duplicate flag name or alias: 'o'"));
  EXPECT_THAT(Calls, IsEmpty());
}

TEST_F(ProgramTest, UnicodeFlagNameIsValid) {
  P.Action = recordAs("main");
  P.Flags.add({"বল", "", "", "", ""});
  EXPECT_EQ(ExitSuccess, P.run(ArgList{"--বল", "x"}));
  EXPECT_THAT(SetupErrors, IsEmpty());
  ASSERT_EQ(1u, Calls.size());
  EXPECT_THAT(Calls[0].Flags, ElementsAre(Pair("বল", "x")));
}

TEST_F(ProgramTest, InvalidCommandIsSchemaError) {
  Command Bad;
  Bad.Names = {"bad name"};
  P.Commands.add(std::move(Bad));
  EXPECT_EQ(ExitSchemaFailure, P.run(ArgList{"x"}));
  ASSERT_EQ(1u, SetupErrors.size());
  EXPECT_THAT(ParseErrors, IsEmpty());
}

TEST_F(ProgramTest, ParseErrorGoesToParseHandler) {
  P.Action = recordAs("main");
  P.Flags.add({"config", "c", "", "", ""});
  EXPECT_EQ(ExitInputFailure, P.run(ArgList{"pos"}));
  EXPECT_EQ(ExitInputFailure, P.run(ArgList{"pos", "--config"}));
  EXPECT_THAT(ParseErrors,
              ElementsAre("tool: no given or default value for flag: "
                          "\"config\"",
                          "tool: no corresponding value for flag: "
                          "\"--config\""));
  EXPECT_THAT(Calls, IsEmpty());
}

TEST_F(ProgramTest, CommandParseErrorGoesToParseHandler) {
  addBuildCommand();
  EXPECT_EQ(ExitInputFailure, P.run(ArgList{"build", "-j"}));
  EXPECT_THAT(ParseErrors,
              ElementsAre("tool: no corresponding value for flag: \"-j\""));
}

TEST_F(ProgramTest, ActionErrorGoesToActionHandler) {
  P.Action = [](const FlagMap &, const ArgList &) {
    return createActionError("disk full");
  };
  Command Fail;
  Fail.Names = {"fail"};
  Fail.Action = [](const FlagMap &, const ArgList &) {
    return createActionError("tool: already prefixed");
  };
  P.Commands.add(std::move(Fail));

  EXPECT_EQ(ExitActionFailure, P.run(ArgList{}));
  EXPECT_EQ(ExitActionFailure, P.run(ArgList{"fail"}));
  EXPECT_THAT(ActionErrors,
              ElementsAre("tool: disk full", "tool: already prefixed"));
  EXPECT_THAT(ParseErrors, IsEmpty());
}

TEST_F(ProgramTest, EmptyHandlerStillReportsExitCode) {
  P.ParseErrorHandler = nullptr;
  EXPECT_EQ(ExitInputFailure, P.run(ArgList{}));
}

TEST_F(ProgramTest, CheckReportsFirstProblem) {
  EXPECT_FALSE(P.check());
  P.Flags.add({"bad flag", "", "", "", "x"});
  Error Err = P.check();
  ASSERT_TRUE(Err);
  EXPECT_EQ(ErrorKind::Schema, Err.getKind());
}

//===----------------------------------------------------------------------===//
// Diagnostics
//===----------------------------------------------------------------------===//

TEST(DiagnosticTest, FormatDiagnostic) {
  EXPECT_EQ("tool: boom", formatDiagnostic("tool", "boom"));
  EXPECT_EQ("tool: boom", formatDiagnostic("tool", "tool: boom"));
  EXPECT_EQ("tool: toolbox: boom", formatDiagnostic("tool", "toolbox: boom"));
  EXPECT_EQ("boom", formatDiagnostic("", "boom"));
}

TEST(DiagnosticTest, ExitCodes) {
  EXPECT_EQ(ExitSuccess, getExitCode(ErrorKind::None));
  EXPECT_EQ(ExitSchemaFailure, getExitCode(ErrorKind::Schema));
  EXPECT_EQ(ExitInputFailure, getExitCode(ErrorKind::Input));
  EXPECT_EQ(ExitActionFailure, getExitCode(ErrorKind::Action));
}

TEST(DiagnosticDeathTest, ExitingHandlerPrintsAndExits) {
  ErrorHandlerTy Handler = exitingErrorHandler(ExitInputFailure);
  EXPECT_EXIT(Handler("tool", Error(ErrorCode::MissingCommand, "oops")),
              ::testing::ExitedWithCode(ExitInputFailure), "tool: oops");
}

TEST(DiagnosticDeathTest, DefaultHandlersExit) {
  Program P;
  P.Name = "tool";
  P.Version = "1.0";
  EXPECT_EXIT(P.run(ArgList{}), ::testing::ExitedWithCode(ExitInputFailure),
              "tool: use the \"--help\" global flag");

  P.Flags.add({"", "", "", "", ""});
  EXPECT_EXIT(P.run(ArgList{}), ::testing::ExitedWithCode(ExitSchemaFailure),
              "tool: missing name of flag");
}

} // anonymous namespace
