#include "msh/Builtins.hpp"
#include "msh/Log.hpp"

#include <fmt/core.h>

namespace msh::builtin {

// NEWNAME                 list
// NEWNAME name            delete
// NEWNAME name command    define or overwrite
Result<> newName(std::span<std::string const> args, AliasTable& aliases, std::size_t max_aliases) {
  switch (args.size()) {
    case 1: printAliases(aliases); return {};
    case 2: {
      auto const& name = args[1];
      if (aliases.remove(name)) {
        fmt::print("Alias '{}' deleted.\n", name);
      } else {
        fmt::print("Alias '{}' does not exist.\n", name);
      }
      return {};
    }
    case 3: {
      auto const& name    = args[1];
      auto const& command = args[2];
      if (!aliases.contains(name) && aliases.size() >= max_aliases) {
        return makeError(
            ErrorKind::Capacity,
            fmt::format("Cannot define alias '{}': the limit of {} aliases has been reached", name, max_aliases)
        );
      }
      aliases.set(name, command);
      log::verbose("alias table now holds {} of {}", aliases.size(), max_aliases);
      fmt::print("Alias '{}' defined for '{}'.\n", name, command);
      return {};
    }
    default: return makeError(ErrorKind::Usage, "Invalid usage of NEWNAME command.");
  }
}

} // namespace msh::builtin
