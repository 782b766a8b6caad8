#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace msh {

// Alias name -> command line ("cmd arg1 arg2"). Iteration order is unspecified.
class AliasTable {
  using Map = std::unordered_map<std::string, std::string>;

  Map entries_;

public:
  using const_iterator = Map::const_iterator;

  AliasTable() = default;

  // Returns true when a new name was added, false when an existing one was overwritten.
  bool set(std::string name, std::string command);
  bool remove(std::string const& name);
  void clear() noexcept;

  [[nodiscard]] std::optional<std::string> find(std::string const& name) const;
  [[nodiscard]] bool                       contains(std::string const& name) const;
  [[nodiscard]] std::size_t                size() const noexcept;
  [[nodiscard]] bool                       empty() const noexcept;

  [[nodiscard]] const_iterator begin() const noexcept {
    return entries_.begin();
  }
  [[nodiscard]] const_iterator end() const noexcept {
    return entries_.end();
  }

  bool operator==(AliasTable const&) const = default;
};

} // namespace msh
