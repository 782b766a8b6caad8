#pragma once

#include "msh/Constants.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace msh {

struct ShellOptions {
  std::string                name_        = std::string(DEFAULT_SHELL_NAME);
  std::string                terminator_  = std::string(DEFAULT_TERMINATOR);
  std::size_t                max_aliases_ = DEFAULT_MAX_ALIASES;
  std::optional<std::string> alias_file_;
  std::optional<std::string> command_;
  bool                       verbose_ = false;
};

} // namespace msh
