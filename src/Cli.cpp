#include "msh/Cli.hpp"
#include "msh/Constants.hpp"

#include <algorithm>
#include <charconv>
#include <string>
#include <system_error>
#include <utility>
#include <fmt/core.h>

namespace msh::cli {

namespace {

bool isShortOption(std::string const& arg) noexcept {
  return arg.length() >= 2 && arg[0] == '-' && arg[1] != '-' && std::isalpha(arg[1], LOCALE);
}

bool isLongOption(std::string const& arg) noexcept {
  return arg.length() >= 3 && arg[0] == '-' && arg[1] == '-' && std::isalpha(arg[2], LOCALE);
}

std::string optionName(std::string const& arg) {
  if (isLongOption(arg)) {
    return arg.substr(2);
  }
  if (isShortOption(arg)) {
    return arg.substr(1);
  }
  return arg;
}

std::string optionLabel(Option const& option) {
  std::string label;
  if (!option.shortName().empty()) {
    label += fmt::format("-{}", option.shortName());
  }
  if (!option.longName().empty()) {
    if (!label.empty()) {
      label += ", ";
    }
    label += fmt::format("--{}", option.longName());
  }
  if (option.type() == Option::Type::Value) {
    label += " <val>";
  }
  return label;
}

} // namespace

Option::Option(std::string short_name, std::string long_name, std::string description, Type type)
    : short_name_(std::move(short_name))
    , long_name_(std::move(long_name))
    , description_(std::move(description))
    , type_(type) {}

Option& Option::defaultValue(std::string value) {
  default_value_ = std::move(value);
  return *this;
}

Option& Option::validator(std::function<bool(std::string const&)> validate_func) {
  validator_ = std::move(validate_func);
  return *this;
}

bool Option::accepts(std::string const& value) const {
  return !validator_ || validator_(value);
}

void Arguments::set(std::string const& name, std::string value) {
  values_[name] = std::move(value);
}

bool Arguments::has(std::string const& name) const {
  return values_.contains(name);
}

std::optional<std::string> Arguments::get(std::string const& name) const {
  if (auto it = values_.find(name); it != values_.end()) {
    return it->second;
  }
  return std::nullopt;
}

ArgumentParser::ArgumentParser(std::string program_name, std::string description)
    : program_name_(std::move(program_name)), description_(std::move(description)) {}

Option&
ArgumentParser::addOption(std::string short_name, std::string long_name, std::string description, Option::Type type) {
  if (!short_name.empty()) {
    option_map_[short_name] = options_.size();
  }
  if (!long_name.empty()) {
    option_map_[long_name] = options_.size();
  }
  return options_.emplace_back(std::move(short_name), std::move(long_name), std::move(description), type);
}

std::expected<Arguments, std::string> ArgumentParser::parse(int argc, char const* const* argv) const {
  std::vector<std::string> args;
  args.reserve(argc > 1 ? argc - 1 : 0);
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse(std::span<std::string const>(args));
}

std::expected<Arguments, std::string> ArgumentParser::parse(std::span<std::string const> args) const {
  Arguments result;

  for (size_t i = 0; i < args.size(); ++i) {
    std::string const& arg = args[i];

    if (!isShortOption(arg) && !isLongOption(arg)) {
      return std::unexpected(fmt::format("Unexpected positional argument: {}", arg));
    }

    auto index = findOption(optionName(arg));
    if (!index) {
      return std::unexpected(fmt::format("Unknown option: {}", arg));
    }

    Option const& option = options_[*index];
    if (option.type() == Option::Type::Flag) {
      result.set(option.longName(), "true");
      continue;
    }

    if (i + 1 >= args.size()) {
      return std::unexpected(fmt::format("Option {} requires a value", arg));
    }
    std::string const& value = args[++i];
    if (!option.accepts(value)) {
      return std::unexpected(fmt::format("Invalid value for option {}: {}", arg, value));
    }
    result.set(option.longName(), value);
  }

  for (Option const& option : options_) {
    if (!result.has(option.longName()) && option.defaultValue()) {
      result.set(option.longName(), *option.defaultValue());
    }
  }

  return result;
}

std::string ArgumentParser::help() const {
  std::string out;
  if (!description_.empty()) {
    out += fmt::format("{}\n\n", description_);
  }
  out += fmt::format("{}\n", usage());
  if (options_.empty()) {
    return out;
  }

  size_t width = 0;
  for (Option const& option : options_) {
    width = std::max(width, optionLabel(option).size());
  }

  out += "\nOptions:\n";
  for (Option const& option : options_) {
    out += fmt::format("  {:<{}}{}", optionLabel(option), width + 2, option.description());
    if (option.defaultValue()) {
      out += fmt::format(" (default: {})", *option.defaultValue());
    }
    out += '\n';
  }
  return out;
}

std::string ArgumentParser::usage() const {
  return fmt::format("Usage: {}{}", program_name_, options_.empty() ? "" : " [options]");
}

std::optional<std::size_t> ArgumentParser::findOption(std::string const& name) const {
  auto it = option_map_.find(name);
  return it != option_map_.end() ? std::optional{it->second} : std::nullopt;
}

std::optional<std::size_t> parsePositive(std::string const& value) {
  std::size_t n = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
  if (ec != std::errc{} || ptr != value.data() + value.size() || n == 0) {
    return std::nullopt;
  }
  return n;
}

bool isPositiveInteger(std::string const& value) {
  return parsePositive(value).has_value();
}

ArgumentParser createShellParser(std::string program_name) {
  ArgumentParser parser(std::move(program_name), std::string(EXE_DESC));

  parser.addOption("n", "name", "Initial shell name shown in the prompt", Option::Type::Value)
      .defaultValue(std::string(DEFAULT_SHELL_NAME));
  parser.addOption("t", "terminator", "Initial prompt terminator", Option::Type::Value)
      .defaultValue(std::string(DEFAULT_TERMINATOR));
  parser.addOption("m", "max-aliases", "Maximum number of aliases the table may hold", Option::Type::Value)
      .defaultValue(std::to_string(DEFAULT_MAX_ALIASES))
      .validator(isPositiveInteger);
  parser.addOption("a", "aliases", "Alias file to load at start-up", Option::Type::Value);
  parser.addOption("c", "command", "Dispatch the given line and exit", Option::Type::Value);
  parser.addOption("v", "verbose", "Print diagnostics to stderr");
  parser.addOption("h", "help", "Show this help message and exit");
  parser.addOption("", "version", "Show version information and exit");

  return parser;
}

std::expected<ShellOptions, std::string> toShellOptions(Arguments const& args) {
  ShellOptions options;
  if (auto name = args.get("name")) {
    options.name_ = *name;
  }
  if (auto terminator = args.get("terminator")) {
    options.terminator_ = *terminator;
  }
  if (auto max = args.get("max-aliases")) {
    auto limit = parsePositive(*max);
    if (!limit) {
      return std::unexpected(fmt::format("Invalid alias limit: {}", *max));
    }
    options.max_aliases_ = *limit;
  }
  options.alias_file_ = args.get("aliases");
  options.command_    = args.get("command");
  options.verbose_    = args.has("verbose");
  return options;
}

void printVersion() {
  fmt::print("{} version {}\n", EXE_NAME, VERSION);
}

} // namespace msh::cli
