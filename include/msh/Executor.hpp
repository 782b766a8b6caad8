#pragma once

#include "msh/Error.hpp"

#include <span>
#include <string>

namespace msh {

class ProcessRunner {
public:
  ProcessRunner()                                = default;
  ProcessRunner(ProcessRunner const&)            = delete;
  ProcessRunner& operator=(ProcessRunner const&) = delete;
  ProcessRunner(ProcessRunner&&)                 = delete;
  ProcessRunner& operator=(ProcessRunner&&)      = delete;
  virtual ~ProcessRunner()                       = default;

  // Run `command` with `args` to completion. Succeeds only on a clean zero exit.
  virtual Result<> run(std::string const& command, std::span<std::string const> args) = 0;
};

// fork + execvp, searching PATH, inheriting the shell's stdio.
class PosixProcessRunner final : public ProcessRunner {
public:
  Result<> run(std::string const& command, std::span<std::string const> args) override;
};

} // namespace msh
