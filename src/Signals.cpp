#include "msh/Signals.hpp"

#include <csignal>

namespace msh {

namespace {

void setDisposition(int signo, void (*handler)(int)) {
  struct sigaction sa{};
  sa.sa_handler = handler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(signo, &sa, nullptr);
}

} // namespace

void installShellSignals() {
  setDisposition(SIGINT, SIG_IGN);
  setDisposition(SIGQUIT, SIG_IGN);
}

void resetChildSignals() {
  // SIG_IGN survives execve, so children would otherwise inherit it.
  setDisposition(SIGINT, SIG_DFL);
  setDisposition(SIGQUIT, SIG_DFL);
}

} // namespace msh
