#pragma once

#include "msh/AliasTable.hpp"
#include "msh/Builtins.hpp"
#include "msh/Error.hpp"
#include "msh/Executor.hpp"
#include "msh/ShellState.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace msh {

bool isBuiltin(std::string_view selector) noexcept;

// Route one tokenized line to a builtin or to `runner`. An empty token list is a no-op.
Result<Outcome> dispatch(
    std::span<std::string const> tokens,
    ShellState&                  state,
    AliasTable&                  aliases,
    std::size_t                  max_aliases,
    ProcessRunner&               runner
);

// Resolve tokens[0] through the alias table (dropping the remaining tokens on a hit),
// then run the result.
Result<> invoke(std::span<std::string const> tokens, AliasTable const& aliases, ProcessRunner& runner);

} // namespace msh
