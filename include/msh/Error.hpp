#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace msh {

enum class ErrorKind {
  Usage,    // wrong arity for a builtin
  Io,       // alias file open/read/write failure
  Alias,    // alias expands to nothing
  Capacity, // alias table is full
  Process,  // launch failure or non-zero exit
};

class ShellError {
  ErrorKind   kind_;
  std::string message_;

public:
  ShellError(ErrorKind kind, std::string message);

  [[nodiscard]] ErrorKind          kind() const noexcept;
  [[nodiscard]] std::string const& message() const noexcept;
};

template<typename T = void>
using Result = std::expected<T, ShellError>;

std::unexpected<ShellError> makeError(ErrorKind kind, std::string message);

std::string_view kindName(ErrorKind kind) noexcept;

} // namespace msh
