#include "msh/Shell.hpp"
#include "msh/AliasFile.hpp"
#include "msh/Dispatcher.hpp"
#include "msh/Log.hpp"
#include "msh/Signals.hpp"
#include "msh/Util.hpp"

#include <cstdio>
#include <string>
#include <utility>
#include <fmt/core.h>
#include <unistd.h>

namespace msh {

Shell::Shell(ShellOptions const& options)
    : Shell(options, std::make_unique<PosixProcessRunner>()) {}

Shell::Shell(ShellOptions const& options, std::unique_ptr<ProcessRunner> runner)
    : state_{options.name_, options.terminator_}
    , max_aliases_(options.max_aliases_)
    , runner_(std::move(runner))
    , is_interactive_(isatty(STDIN_FILENO) != 0) {
  initialize(options);
}

void Shell::initialize(ShellOptions const& options) {
  if (is_interactive_) {
    installShellSignals();
  }
  if (options.alias_file_) {
    if (auto loaded = loadAliases(*options.alias_file_, aliases_, max_aliases_); !loaded) {
      log::error(loaded.error());
    } else {
      log::verbose("loaded {} aliases from {}", *loaded, *options.alias_file_);
    }
  }
}

Result<Outcome> Shell::execute(std::string_view line) {
  auto tokens = tokenize(line);
  return dispatch(tokens, state_, aliases_, max_aliases_, *runner_);
}

int Shell::run(std::istream& input) {
  printPrompt();

  std::string line;
  while (std::getline(input, line)) {
    auto outcome = execute(line);
    if (!outcome) {
      log::error(outcome.error());
    } else if (*outcome == Outcome::Terminate) {
      std::fflush(stdout);
      return 0;
    }
    printPrompt();
  }

  log::verbose("end of input");
  return 0;
}

int Shell::runCommand(std::string_view line) {
  auto outcome = execute(line);
  std::fflush(stdout);
  if (!outcome) {
    log::error(outcome.error());
    return 1;
  }
  return 0;
}

void Shell::printPrompt() const {
  if (is_interactive_) {
    fmt::print("{}", buildPrompt(state_));
    std::fflush(stdout);
  }
}

} // namespace msh
