#include "msh/Dispatcher.hpp"
#include "msh/Log.hpp"
#include "msh/Util.hpp"

#include <algorithm>
#include <array>
#include <utility>
#include <vector>
#include <fmt/core.h>

namespace msh {

namespace {

constexpr std::array<std::string_view, 7> BUILTIN_NAMES = {
    "STOP",
    "SETSHELLNAME",
    "SETTERMINATOR",
    "NEWNAME",
    "READNEWNAMES",
    "LISTNEWNAMES",
    "SAVENEWNAMES",
};

Result<Outcome> continueWith(Result<> result) {
  if (!result) {
    return std::unexpected(std::move(result.error()));
  }
  return Outcome::Continue;
}

} // namespace

bool isBuiltin(std::string_view selector) noexcept {
  return std::ranges::find(BUILTIN_NAMES, selector) != BUILTIN_NAMES.end();
}

Result<Outcome> dispatch(
    std::span<std::string const> tokens,
    ShellState&                  state,
    AliasTable&                  aliases,
    std::size_t                  max_aliases,
    ProcessRunner&               runner
) {
  if (tokens.empty()) {
    return Outcome::Continue;
  }

  auto const& selector = tokens[0];
  log::verbose("dispatching '{}' with {} argument(s)", selector, tokens.size() - 1);

  if (!isBuiltin(selector)) {
    return continueWith(invoke(tokens, aliases, runner));
  }
  if (selector == "STOP") {
    return builtin::stop(tokens);
  }
  if (selector == "SETSHELLNAME") {
    return continueWith(builtin::setShellName(tokens, state));
  }
  if (selector == "SETTERMINATOR") {
    return continueWith(builtin::setTerminator(tokens, state));
  }
  if (selector == "NEWNAME") {
    return continueWith(builtin::newName(tokens, aliases, max_aliases));
  }
  if (selector == "READNEWNAMES") {
    return continueWith(builtin::readNewNames(tokens, aliases, max_aliases));
  }
  if (selector == "LISTNEWNAMES") {
    return continueWith(builtin::listNewNames(aliases));
  }
  // SAVENEWNAMES
  return continueWith(builtin::saveNewNames(tokens, aliases));
}

Result<> invoke(std::span<std::string const> tokens, AliasTable const& aliases, ProcessRunner& runner) {
  if (tokens.empty()) {
    return {};
  }

  auto const& name = tokens[0];
  if (auto command_line = aliases.find(name)) {
    auto words = tokenize(*command_line);
    if (words.empty()) {
      return makeError(ErrorKind::Alias, fmt::format("Alias '{}' expands to an empty command", name));
    }
    log::verbose("alias '{}' expands to '{}'", name, *command_line);
    if (tokens.size() > 1) {
      log::verbose("discarding {} argument(s) given to alias '{}'", tokens.size() - 1, name);
    }
    return runner.run(words.front(), std::span<std::string const>(words).subspan(1));
  }

  return runner.run(name, tokens.subspan(1));
}

} // namespace msh
