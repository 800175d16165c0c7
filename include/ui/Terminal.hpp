#pragma once

#include <atomic>
#include <string>

namespace netneighbor::ui {

// Set by SIGINT/SIGTERM; the poll loop checks it between cycles and while sleeping.
extern std::atomic<bool> g_stop;

void on_stop_signal(int);
void install_stop_handlers();

// Terminal capability detection
[[nodiscard]] bool tty_stdout();

// SGR code generation; empty strings when `enabled` is false
[[nodiscard]] std::string sgr(const char* code, bool enabled);
[[nodiscard]] std::string sgr_reset(bool enabled);

enum class Color { Red = 31, Green = 32, Yellow = 33, Blue = 34, Magenta = 35, Cyan = 36 };

// Wrap text in a foreground color and reset.
[[nodiscard]] std::string paint(const std::string& text, Color c, bool enabled);

} // namespace netneighbor::ui
