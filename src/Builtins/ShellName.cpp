#include "msh/Builtins.hpp"
#include "msh/Util.hpp"

#include <fmt/core.h>

namespace msh::builtin {

Result<> setShellName(std::span<std::string const> args, ShellState& state) {
  state.name_ = join(args.empty() ? args : args.subspan(1));
  fmt::print("Shell name set to: {}\n", state.name_);
  return {};
}

} // namespace msh::builtin
