#include "msh/Util.hpp"
#include "msh/Constants.hpp"

#include <locale>
#include <utility>

namespace msh {

std::locale const& LOCALE = std::locale::classic(); // NOLINT

std::vector<std::string> tokenize(std::string_view line) {
  std::vector<std::string> tokens;
  std::string              current;
  for (char c : line) {
    if (std::isspace(c, LOCALE)) {
      if (!current.empty()) {
        tokens.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    current.push_back(c);
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

std::string join(std::span<std::string const> words, std::string_view separator) {
  std::string out;
  for (size_t i = 0; i < words.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += words[i];
  }
  return out;
}

} // namespace msh
