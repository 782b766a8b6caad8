#include "msh/Builtins.hpp"

#include <fmt/core.h>

namespace msh {

void printAliases(AliasTable const& aliases) {
  fmt::print("Aliases:\n");
  for (auto const& [name, command] : aliases) {
    fmt::print("{} - {}\n", name, command);
  }
}

} // namespace msh
