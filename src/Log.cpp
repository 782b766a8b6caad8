#include "msh/Log.hpp"

#include <cstdio>
#include <fmt/core.h>

namespace msh::log {

namespace {

bool verbose_enabled = false; // NOLINT

} // namespace

void setVerbose(bool enabled) noexcept {
  verbose_enabled = enabled;
}

bool isVerbose() noexcept {
  return verbose_enabled;
}

void error(ShellError const& err) {
  verbose("{} error", kindName(err.kind()));
  fmt::print(stderr, "Error: {}\n", err.message());
}

} // namespace msh::log
