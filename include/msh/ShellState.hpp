#pragma once

#include "msh/Constants.hpp"

#include <string>

namespace msh {

struct ShellState {
  std::string name_       = std::string(DEFAULT_SHELL_NAME);
  std::string terminator_ = std::string(DEFAULT_TERMINATOR);
};

// "{name}{terminator} "
std::string buildPrompt(ShellState const& state);

} // namespace msh
