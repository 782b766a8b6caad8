#include "msh/Builtins.hpp"

#include <fmt/core.h>

namespace msh::builtin {

// Only the first argument is used; anything after it is ignored.
Result<> setTerminator(std::span<std::string const> args, ShellState& state) {
  if (args.size() < 2) {
    fmt::print("No terminator specified. Using the default terminator: {}\n", state.terminator_);
    return {};
  }
  state.terminator_ = args[1];
  fmt::print("Terminator set to: {}\n", state.terminator_);
  return {};
}

} // namespace msh::builtin
