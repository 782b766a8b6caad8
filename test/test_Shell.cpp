#include "msh/Shell.hpp"
#include "test_utils.h"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using msh::test::readFile;
using msh::test::RecordingProcessRunner;
using msh::test::TempDir;
using msh::test::writeFile;

namespace {

struct RunResult {
  int         status_ = -1;
  std::string output_;
};

// Runs the built msh binary with `input` on stdin; stdout and stderr are merged.
RunResult runShellWithInput(std::string const& input, std::vector<std::string> const& args = {}) {
  RunResult   result;
  std::string shell = MSH_BINARY_PATH;
  if (access(shell.c_str(), X_OK) != 0) {
    ADD_FAILURE() << "Shell binary not found at " << shell;
    return result;
  }

  std::array<int, 2> inpipe{};  // parent writes -> child stdin
  std::array<int, 2> outpipe{}; // child stdout/err -> parent reads
  if (pipe2(inpipe.data(), O_CLOEXEC) != 0) {
    return result;
  }
  if (pipe2(outpipe.data(), O_CLOEXEC) != 0) {
    close(inpipe[0]);
    close(inpipe[1]);
    return result;
  }

  std::vector<std::string> words = {shell};
  words.insert(words.end(), args.begin(), args.end());
  std::vector<char*> argv;
  for (auto& word : words) {
    argv.push_back(word.data());
  }
  argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    close(inpipe[0]);
    close(inpipe[1]);
    close(outpipe[0]);
    close(outpipe[1]);
    return result;
  }
  if (pid == 0) {
    dup2(inpipe[0], STDIN_FILENO);
    dup2(outpipe[1], STDOUT_FILENO);
    dup2(outpipe[1], STDERR_FILENO);
    execv(argv[0], argv.data());
    std::perror("exec msh");
    _exit(127);
  }
  close(inpipe[0]);
  close(outpipe[1]);

  ssize_t off = 0;
  while (off < static_cast<ssize_t>(input.size())) {
    ssize_t n = write(inpipe[1], input.data() + off, input.size() - off);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    off += n;
  }
  close(inpipe[1]);

  std::string            out;
  std::array<char, 4096> buf{};
  while (true) {
    ssize_t n = read(outpipe[0], buf.data(), buf.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (n == 0) {
      break;
    }
    out.append(buf.data(), static_cast<size_t>(n));
  }
  close(outpipe[0]);

  int status = 0;
  (void) waitpid(pid, &status, 0);
  result.status_ = status;
  result.output_ = std::move(out);
  return result;
}

bool exitedWith(RunResult const& res, int code) {
  return WIFEXITED(res.status_) && WEXITSTATUS(res.status_) == code;
}

} // namespace

TEST(Shell, StopExitsImmediately) {
  auto res = runShellWithInput("SETSHELLNAME A\nSTOP\nSETSHELLNAME B\n");
  EXPECT_TRUE(exitedWith(res, 0));
  EXPECT_EQ(res.output_, "Shell name set to: A\n");
}

TEST(Shell, EndOfInputExitsCleanly) {
  auto res = runShellWithInput("SETTERMINATOR $\n");
  EXPECT_TRUE(exitedWith(res, 0));
  EXPECT_EQ(res.output_, "Terminator set to: $\n");
}

TEST(Shell, BlankLinesAreIgnored) {
  auto res = runShellWithInput("\n   \n\t\nSTOP\n");
  EXPECT_TRUE(exitedWith(res, 0));
  EXPECT_EQ(res.output_, "");
}

TEST(Shell, RunsExternalProgram) {
  auto res = runShellWithInput("echo hello world\nSTOP\n");
  EXPECT_TRUE(exitedWith(res, 0));
  EXPECT_EQ(res.output_, "hello world\n");
}

TEST(Shell, AliasDropsArguments) {
  auto res = runShellWithInput("NEWNAME say echo\nsay hello\nSTOP\n");
  EXPECT_TRUE(exitedWith(res, 0));
  EXPECT_EQ(res.output_, "Alias 'say' defined for 'echo'.\n\n");
}

TEST(Shell, FailuresAreReportedAndLoopContinues) {
  auto res = runShellWithInput("msh-no-such-command\nfalse\nNEWNAME a b c\necho still here\nSTOP\n");
  EXPECT_TRUE(exitedWith(res, 0));
  EXPECT_NE(res.output_.find("Error: Command 'msh-no-such-command' could not be launched"), std::string::npos);
  EXPECT_NE(res.output_.find("Error: Command 'false' returned a non-zero exit status (1)"), std::string::npos);
  EXPECT_NE(res.output_.find("Error: Invalid usage of NEWNAME command."), std::string::npos);
  EXPECT_NE(res.output_.find("still here\n"), std::string::npos);
}

TEST(Shell, SaveAndLoadAcrossSessions) {
  TempDir dir;
  auto    path = dir.file("aliases.txt");

  auto first = runShellWithInput("NEWNAME greet echo\nSAVENEWNAMES " + path + "\nSTOP\n");
  EXPECT_TRUE(exitedWith(first, 0));
  EXPECT_NE(first.output_.find("Aliases saved to file: " + path + "\n"), std::string::npos);
  EXPECT_EQ(readFile(path), "greet echo\n");

  auto second = runShellWithInput("LISTNEWNAMES\nSTOP\n", {"--aliases", path});
  EXPECT_TRUE(exitedWith(second, 0));
  EXPECT_EQ(second.output_, "Aliases:\ngreet - echo\n");
}

TEST(Shell, ReadNewNamesMultiWordAlias) {
  TempDir dir;
  auto    path = dir.file("aliases.txt");
  writeFile(path, "hi echo hello there\n");

  auto res = runShellWithInput("READNEWNAMES " + path + "\nhi ignored\nSTOP\n");
  EXPECT_TRUE(exitedWith(res, 0));
  EXPECT_EQ(res.output_, "Loaded 1 aliases from file: " + path + "\nhello there\n");
}

TEST(Shell, StartupFileRespectsLimit) {
  TempDir dir;
  auto    path = dir.file("aliases.txt");
  writeFile(path, "a 1\nb 2\nc 3\n");

  auto res = runShellWithInput("LISTNEWNAMES\nNEWNAME z 9\nSTOP\n", {"-a", path, "-m", "2"});
  EXPECT_TRUE(exitedWith(res, 0));
  EXPECT_NE(res.output_.find("a - 1\n"), std::string::npos);
  EXPECT_NE(res.output_.find("b - 2\n"), std::string::npos);
  EXPECT_EQ(res.output_.find("c - 3\n"), std::string::npos);
  EXPECT_NE(res.output_.find("limit of 2 aliases"), std::string::npos);
}

TEST(Shell, MissingStartupFileIsReported) {
  TempDir dir;
  auto    res = runShellWithInput("STOP\n", {"--aliases", dir.file("missing.txt")});
  EXPECT_TRUE(exitedWith(res, 0));
  EXPECT_NE(res.output_.find("Error: Cannot open alias file"), std::string::npos);
}

TEST(Shell, CommandMode) {
  auto ok = runShellWithInput("", {"-c", "SETSHELLNAME x  y"});
  EXPECT_TRUE(exitedWith(ok, 0));
  EXPECT_EQ(ok.output_, "Shell name set to: x y\n");

  auto stop = runShellWithInput("", {"-c", "STOP"});
  EXPECT_TRUE(exitedWith(stop, 0));

  auto failed = runShellWithInput("", {"-c", "false"});
  EXPECT_TRUE(exitedWith(failed, 1));
}

TEST(Shell, Version) {
  auto res = runShellWithInput("", {"--version"});
  EXPECT_TRUE(exitedWith(res, 0));
  EXPECT_EQ(res.output_, "msh version 0.1.0\n");
}

TEST(Shell, BadOptionPrintsHelp) {
  auto res = runShellWithInput("", {"--no-such-option"});
  EXPECT_TRUE(exitedWith(res, 1));
  EXPECT_NE(res.output_.find("Error: Unknown option: --no-such-option"), std::string::npos);
  EXPECT_NE(res.output_.find("Usage:"), std::string::npos);
}

// In-process loop over a string stream, with a recording runner.

TEST(ShellLoop, ThreadsStateThroughDispatch) {
  auto  runner   = std::make_unique<RecordingProcessRunner>();
  auto* recorder = runner.get();

  msh::Shell         shell(msh::ShellOptions{}, std::move(runner));
  std::istringstream input("SETSHELLNAME Box\nSETTERMINATOR $\nNEWNAME x y\nx 1 2\nSTOP\nz\n");

  testing::internal::CaptureStdout();
  int status = shell.run(input);
  testing::internal::GetCapturedStdout();

  EXPECT_EQ(status, 0);
  EXPECT_EQ(shell.state().name_, "Box");
  EXPECT_EQ(shell.state().terminator_, "$");
  EXPECT_EQ(shell.aliases().find("x"), "y");
  ASSERT_EQ(recorder->calls_.size(), 1U);
  EXPECT_EQ(recorder->calls_[0].command_, "y");
  EXPECT_TRUE(recorder->calls_[0].args_.empty());
}

TEST(ShellLoop, ExecuteReturnsErrors) {
  msh::ShellOptions options;
  options.max_aliases_ = 1;
  msh::Shell shell(options, std::make_unique<RecordingProcessRunner>());

  testing::internal::CaptureStdout();
  EXPECT_TRUE(shell.execute("NEWNAME a b").has_value());
  auto result = shell.execute("NEWNAME c d");
  testing::internal::GetCapturedStdout();

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), msh::ErrorKind::Capacity);
}
