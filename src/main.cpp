#include "msh/Cli.hpp"
#include "msh/Log.hpp"
#include "msh/Shell.hpp"

#include <cstdio>
#include <iostream>
#include <fmt/core.h>

int main(int argc, char* argv[]) {
  auto parser = msh::cli::createShellParser(argc > 0 ? argv[0] : "msh");
  auto args   = parser.parse(argc, argv);

  if (!args) {
    fmt::print(stderr, "Error: {}\n\n{}", args.error(), parser.help());
    return 1;
  }
  if (args->has("help")) {
    fmt::print("{}", parser.help());
    return 0;
  }
  if (args->has("version")) {
    msh::cli::printVersion();
    return 0;
  }

  auto options = msh::cli::toShellOptions(*args);
  if (!options) {
    fmt::print(stderr, "Error: {}\n", options.error());
    return 1;
  }

  msh::log::setVerbose(options->verbose_);
  msh::log::verbose("verbose output enabled");

  msh::Shell shell(*options);
  if (options->command_) {
    return shell.runCommand(*options->command_);
  }
  return shell.run(std::cin);
}
