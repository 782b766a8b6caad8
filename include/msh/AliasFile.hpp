#pragma once

#include "msh/AliasTable.hpp"
#include "msh/Error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace msh {

// Split "name command line..." on the first space. Both halves must be non-empty.
std::optional<std::pair<std::string, std::string>> parseAliasLine(std::string_view line);

// Adds entries from `path` on top of what `table` holds, stopping once a new entry brings the
// table to `max_aliases`. A full table still takes overwrites of existing names but skips new
// ones. Returns the number of lines applied.
Result<std::size_t> loadAliases(std::string const& path, AliasTable& table, std::size_t max_aliases);

// Truncates `path` and writes one "name command" line per alias. Stops at the first failed
// write and leaves whatever reached the disk. Returns the number of lines written.
Result<std::size_t> saveAliases(std::string const& path, AliasTable const& table);

} // namespace msh
