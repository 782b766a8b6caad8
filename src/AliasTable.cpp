#include "msh/AliasTable.hpp"

#include <utility>

namespace msh {

bool AliasTable::set(std::string name, std::string command) {
  return entries_.insert_or_assign(std::move(name), std::move(command)).second;
}

bool AliasTable::remove(std::string const& name) {
  return entries_.erase(name) > 0;
}

void AliasTable::clear() noexcept {
  entries_.clear();
}

std::optional<std::string> AliasTable::find(std::string const& name) const {
  if (auto it = entries_.find(name); it != entries_.end()) {
    return it->second;
  }
  return std::nullopt;
}

bool AliasTable::contains(std::string const& name) const {
  return entries_.contains(name);
}

std::size_t AliasTable::size() const noexcept {
  return entries_.size();
}

bool AliasTable::empty() const noexcept {
  return entries_.empty();
}

} // namespace msh
