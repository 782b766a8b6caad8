#pragma once

#include <cstddef>
#include <locale>
#include <string_view>

namespace msh {

extern std::locale const& LOCALE; // NOLINT

inline constexpr std::string_view EXE_NAME = "msh";
inline constexpr std::string_view EXE_DESC = "A minimal interactive shell with persistent command aliases";
inline constexpr std::string_view VERSION  = "0.1.0";

inline constexpr std::string_view DEFAULT_SHELL_NAME  = "My Shell";
inline constexpr std::string_view DEFAULT_TERMINATOR  = ">";
inline constexpr std::size_t      DEFAULT_MAX_ALIASES = 10;

} // namespace msh
