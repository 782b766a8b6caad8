#pragma once

#include "msh/Error.hpp"

#include <cstdio>
#include <utility>
#include <fmt/core.h>

namespace msh::log {

void setVerbose(bool enabled) noexcept;
bool isVerbose() noexcept;

// Diagnostic line on stderr, only emitted with --verbose.
template<typename... Args>
void verbose(fmt::format_string<Args...> format, Args&&... args) {
  if (!isVerbose()) {
    return;
  }
  fmt::print(stderr, "msh: {}\n", fmt::format(format, std::forward<Args>(args)...));
}

void error(ShellError const& err);

} // namespace msh::log
