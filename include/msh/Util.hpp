#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace msh {

// Split on runs of whitespace; leading and trailing whitespace yields no empty tokens.
std::vector<std::string> tokenize(std::string_view line);

std::string join(std::span<std::string const> words, std::string_view separator = " ");

} // namespace msh
