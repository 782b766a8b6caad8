#include "msh/AliasFile.hpp"
#include "msh/Log.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <fmt/core.h>

namespace msh {

std::optional<std::pair<std::string, std::string>> parseAliasLine(std::string_view line) {
  auto pos = line.find(' ');
  if (pos == std::string_view::npos || pos == 0 || pos + 1 == line.size()) {
    return std::nullopt;
  }
  return std::pair{std::string(line.substr(0, pos)), std::string(line.substr(pos + 1))};
}

Result<std::size_t> loadAliases(std::string const& path, AliasTable& table, std::size_t max_aliases) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return makeError(ErrorKind::Io, fmt::format("Cannot open alias file '{}': {}", path, std::strerror(errno)));
  }

  std::size_t loaded = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    auto entry = parseAliasLine(line);
    if (!entry) {
      log::verbose("skipping malformed alias line '{}'", line);
      continue;
    }
    // A full table still accepts overwrites of names it already holds.
    if (table.size() >= max_aliases && !table.contains(entry->first)) {
      log::verbose("alias table is full, skipping new alias '{}'", entry->first);
      continue;
    }
    bool added = table.set(std::move(entry->first), std::move(entry->second));
    ++loaded;
    if (added && table.size() >= max_aliases) {
      log::verbose("alias table reached its limit of {}", max_aliases);
      break;
    }
  }

  if (in.bad()) {
    return makeError(ErrorKind::Io, fmt::format("Error reading alias file '{}': {}", path, std::strerror(errno)));
  }
  return loaded;
}

Result<std::size_t> saveAliases(std::string const& path, AliasTable const& table) {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    return makeError(ErrorKind::Io, fmt::format("Cannot create alias file '{}': {}", path, std::strerror(errno)));
  }

  std::size_t written = 0;
  for (auto const& [name, command] : table) {
    out << name << ' ' << command << '\n';
    if (!out) {
      return makeError(
          ErrorKind::Io,
          fmt::format(
              "Error writing alias '{}' to '{}' after buffering {} lines: {}",
              name,
              path,
              written,
              std::strerror(errno)
          )
      );
    }
    ++written;
  }

  out.flush();
  if (!out) {
    return makeError(ErrorKind::Io, fmt::format("Error flushing alias file '{}': {}", path, std::strerror(errno)));
  }
  return written;
}

} // namespace msh
