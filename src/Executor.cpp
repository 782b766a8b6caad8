#include "msh/Executor.hpp"
#include "msh/FileDescriptor.hpp"
#include "msh/Log.hpp"
#include "msh/Signals.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>
#include <fmt/core.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <fcntl.h>
#include <unistd.h>

namespace {

std::vector<char*> toArgv(std::vector<std::string>& words) {
  std::vector<char*> argv;
  argv.reserve(words.size() + 1);
  for (auto& word : words) {
    argv.push_back(word.data());
  }
  argv.push_back(nullptr);
  return argv;
}

// Blocks until the child either execs (pipe closes, returns 0) or reports its exec errno.
int readExecErrno(int fd) {
  int     err = 0;
  ssize_t n   = 0;
  do {
    n = read(fd, &err, sizeof(err));
  } while (n < 0 && errno == EINTR);
  return n == static_cast<ssize_t>(sizeof(err)) ? err : 0;
}

} // namespace

namespace msh {

Result<> PosixProcessRunner::run(std::string const& command, std::span<std::string const> args) {
  std::vector<std::string> words;
  words.reserve(args.size() + 1);
  words.push_back(command);
  words.insert(words.end(), args.begin(), args.end());
  auto argv = toArgv(words);

  std::array<int, 2> pipefd{};
  if (pipe2(pipefd.data(), O_CLOEXEC) < 0) {
    return makeError(ErrorKind::Process, fmt::format("pipe: {}", std::strerror(errno)));
  }
  FileDescriptor read_fd(pipefd[0]);
  FileDescriptor write_fd(pipefd[1]);

  // Anything still buffered would otherwise appear after the child's output.
  std::fflush(stdout);
  std::fflush(stderr);

  pid_t pid = fork();
  if (pid < 0) {
    return makeError(ErrorKind::Process, fmt::format("fork: {}", std::strerror(errno)));
  }

  if (pid == 0) {
    resetChildSignals();
    read_fd.reset();
    execvp(argv[0], argv.data());
    int err = errno;
    (void) !write(write_fd.get(), &err, sizeof(err));
    _exit(127);
  }

  write_fd.reset();
  log::verbose("started '{}' as pid {}", command, pid);
  int exec_errno = readExecErrno(read_fd.get());

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return makeError(ErrorKind::Process, fmt::format("waitpid: {}", std::strerror(errno)));
    }
  }

  if (exec_errno != 0) {
    return makeError(
        ErrorKind::Process,
        fmt::format("Command '{}' could not be launched: {}", command, std::strerror(exec_errno))
    );
  }
  if (WIFSIGNALED(status)) {
    return makeError(
        ErrorKind::Process,
        fmt::format("Command '{}' was terminated by signal {}", command, WTERMSIG(status))
    );
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
    return makeError(
        ErrorKind::Process,
        fmt::format("Command '{}' returned a non-zero exit status ({})", command, WEXITSTATUS(status))
    );
  }
  log::verbose("'{}' exited successfully", command);
  return {};
}

} // namespace msh
