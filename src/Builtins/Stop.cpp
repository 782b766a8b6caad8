#include "msh/Builtins.hpp"
#include "msh/Log.hpp"

namespace msh::builtin {

Outcome stop(std::span<std::string const> args) {
  log::verbose("STOP with {} ignored argument(s)", args.empty() ? 0 : args.size() - 1);
  return Outcome::Terminate;
}

} // namespace msh::builtin
