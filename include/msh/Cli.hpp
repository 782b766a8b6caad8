#pragma once

#include "msh/Config.hpp"

#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace msh::cli {

class Option {
public:
  enum class Type {
    Flag,  // --verbose, -v
    Value, // --name "My Shell", -n "My Shell"
  };

private:
  std::string                             short_name_;
  std::string                             long_name_;
  std::string                             description_;
  Type                                    type_;
  std::optional<std::string>              default_value_;
  std::function<bool(std::string const&)> validator_;

public:
  Option(std::string short_name, std::string long_name, std::string description, Type type = Type::Flag);

  Option& defaultValue(std::string value);
  Option& validator(std::function<bool(std::string const&)> validate_func);

  [[nodiscard]] std::string const& shortName() const noexcept {
    return short_name_;
  }
  [[nodiscard]] std::string const& longName() const noexcept {
    return long_name_;
  }
  [[nodiscard]] std::string const& description() const noexcept {
    return description_;
  }
  [[nodiscard]] Type type() const noexcept {
    return type_;
  }
  [[nodiscard]] std::optional<std::string> const& defaultValue() const noexcept {
    return default_value_;
  }
  [[nodiscard]] bool accepts(std::string const& value) const;
};

class Arguments {
  std::unordered_map<std::string, std::string> values_;

public:
  void set(std::string const& name, std::string value);

  [[nodiscard]] bool                       has(std::string const& name) const;
  [[nodiscard]] std::optional<std::string> get(std::string const& name) const;
};

class ArgumentParser {
  std::string                                  program_name_;
  std::string                                  description_;
  std::vector<Option>                          options_;
  std::unordered_map<std::string, std::size_t> option_map_;

public:
  explicit ArgumentParser(std::string program_name, std::string description = "");

  Option& addOption(
      std::string  short_name,
      std::string  long_name,
      std::string  description,
      Option::Type type = Option::Type::Flag
  );

  [[nodiscard]] std::expected<Arguments, std::string> parse(int argc, char const* const* argv) const;
  [[nodiscard]] std::expected<Arguments, std::string> parse(std::span<std::string const> args) const;

  [[nodiscard]] std::string help() const;
  [[nodiscard]] std::string usage() const;

private:
  [[nodiscard]] std::optional<std::size_t> findOption(std::string const& name) const;
};

std::optional<std::size_t> parsePositive(std::string const& value);
bool                       isPositiveInteger(std::string const& value);

ArgumentParser createShellParser(std::string program_name);

// Convert parsed arguments into the options the shell starts with.
std::expected<ShellOptions, std::string> toShellOptions(Arguments const& args);

void printVersion();

} // namespace msh::cli
