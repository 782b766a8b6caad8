#pragma once

#include "msh/AliasTable.hpp"
#include "msh/Error.hpp"
#include "msh/ShellState.hpp"

#include <cstddef>
#include <span>
#include <string>

namespace msh {

enum class Outcome {
  Continue,
  Terminate,
};

namespace builtin {

// Every handler receives the full token list, selector included.
Outcome  stop(std::span<std::string const> args);
Result<> setShellName(std::span<std::string const> args, ShellState& state);
Result<> setTerminator(std::span<std::string const> args, ShellState& state);
Result<> newName(std::span<std::string const> args, AliasTable& aliases, std::size_t max_aliases);
Result<> readNewNames(std::span<std::string const> args, AliasTable& aliases, std::size_t max_aliases);
Result<> listNewNames(AliasTable const& aliases);
Result<> saveNewNames(std::span<std::string const> args, AliasTable const& aliases);

} // namespace builtin

void printAliases(AliasTable const& aliases);

} // namespace msh
