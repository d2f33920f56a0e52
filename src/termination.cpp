#include "termination.h"

namespace {

std::atomic<bool> g_cancelled{ false };

}  // namespace

#ifdef _WIN32

#include <windows.h>

namespace {

BOOL WINAPI console_ctrl_handler(DWORD ctrl_type) {
  switch (ctrl_type) {
    case CTRL_C_EVENT:
    case CTRL_BREAK_EVENT:
    case CTRL_CLOSE_EVENT:
      if (g_cancelled.exchange(true)) { ::ExitProcess(130); }
      return TRUE;
    default: return FALSE;
  }
}

}  // namespace

namespace graft {

void termination_handler_install() { ::SetConsoleCtrlHandler(console_ctrl_handler, TRUE); }

}  // namespace graft

#else  // POSIX

#include <unistd.h>

#include <csignal>
#include <tuple>

namespace {

void signal_handler(int sig) {
  if (g_cancelled.exchange(true)) { _exit(128 + sig); }
  static char const msg[]{ "graft: cancelling, interrupt again to exit\n" };
  std::ignore = write(STDERR_FILENO, msg, sizeof(msg) - 1);
}

}  // namespace

namespace graft {

void termination_handler_install() {
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

}  // namespace graft

#endif

namespace graft {

std::atomic<bool> const *termination_flag() { return &g_cancelled; }

}  // namespace graft
