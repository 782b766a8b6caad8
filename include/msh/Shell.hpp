#pragma once

#include "msh/AliasTable.hpp"
#include "msh/Builtins.hpp"
#include "msh/Config.hpp"
#include "msh/Error.hpp"
#include "msh/Executor.hpp"
#include "msh/ShellState.hpp"

#include <cstddef>
#include <istream>
#include <memory>
#include <string_view>

namespace msh {

// Owns the shell name, terminator and alias table for the lifetime of the read-eval loop.
class Shell {
  ShellState                     state_;
  AliasTable                     aliases_;
  std::size_t                    max_aliases_;
  std::unique_ptr<ProcessRunner> runner_;
  bool                           is_interactive_;

public:
  explicit Shell(ShellOptions const& options);
  Shell(ShellOptions const& options, std::unique_ptr<ProcessRunner> runner);

  // Read lines until end of input or STOP. Returns the process exit status.
  int run(std::istream& input);
  // Dispatch a single line (-c mode).
  int runCommand(std::string_view line);

  Result<Outcome> execute(std::string_view line);

  [[nodiscard]] ShellState const& state() const noexcept {
    return state_;
  }
  [[nodiscard]] AliasTable const& aliases() const noexcept {
    return aliases_;
  }

private:
  void initialize(ShellOptions const& options);
  void printPrompt() const;
};

} // namespace msh
