#include "msh/AliasFile.hpp"
#include "msh/Builtins.hpp"
#include "msh/Log.hpp"

#include <fmt/core.h>

namespace msh::builtin {

Result<> readNewNames(std::span<std::string const> args, AliasTable& aliases, std::size_t max_aliases) {
  if (args.size() != 2) {
    return makeError(ErrorKind::Usage, "Usage: READNEWNAMES <file_name>");
  }

  auto const& path   = args[1];
  auto        loaded = loadAliases(path, aliases, max_aliases);
  if (!loaded) {
    return std::unexpected(loaded.error());
  }
  fmt::print("Loaded {} aliases from file: {}\n", *loaded, path);
  return {};
}

Result<> listNewNames(AliasTable const& aliases) {
  printAliases(aliases);
  return {};
}

Result<> saveNewNames(std::span<std::string const> args, AliasTable const& aliases) {
  if (args.size() != 2) {
    return makeError(ErrorKind::Usage, "Usage: SAVENEWNAMES <file_name>");
  }

  auto const& path    = args[1];
  auto        written = saveAliases(path, aliases);
  if (!written) {
    return std::unexpected(written.error());
  }
  log::verbose("wrote {} aliases to {}", *written, path);
  fmt::print("Aliases saved to file: {}\n", path);
  return {};
}

} // namespace msh::builtin
