#include "msh/Error.hpp"

#include <utility>

namespace msh {

ShellError::ShellError(ErrorKind kind, std::string message)
    : kind_(kind), message_(std::move(message)) {}

ErrorKind ShellError::kind() const noexcept {
  return kind_;
}

std::string const& ShellError::message() const noexcept {
  return message_;
}

std::unexpected<ShellError> makeError(ErrorKind kind, std::string message) {
  return std::unexpected<ShellError>(std::in_place, kind, std::move(message));
}

std::string_view kindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::Usage: return "usage";
    case ErrorKind::Io: return "io";
    case ErrorKind::Alias: return "alias";
    case ErrorKind::Capacity: return "capacity";
    case ErrorKind::Process: return "process";
  }
  return "unknown";
}

} // namespace msh
