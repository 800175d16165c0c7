#include "ui/Terminal.hpp"
#include <signal.h>
#include <unistd.h>

namespace netneighbor::ui {

std::atomic<bool> g_stop{false};

void on_stop_signal(int) { g_stop.store(true); }

void install_stop_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_stop_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);
}

bool tty_stdout() {
  return ::isatty(STDOUT_FILENO) == 1;
}

std::string sgr(const char* code, bool enabled) {
  if (!enabled) return {};
  return std::string("\x1B[") + code + "m";
}

std::string sgr_reset(bool enabled) {
  return sgr("0", enabled);
}

std::string paint(const std::string& text, Color c, bool enabled) {
  if (!enabled) return text;
  return std::string("\x1B[") + std::to_string(static_cast<int>(c)) + "m" + text + sgr_reset(true);
}

} // namespace netneighbor::ui
