#include "msh/ShellState.hpp"

#include <fmt/core.h>

namespace msh {

std::string buildPrompt(ShellState const& state) {
  return fmt::format("{}{} ", state.name_, state.terminator_);
}

} // namespace msh
