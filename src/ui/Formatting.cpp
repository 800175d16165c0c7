#include "ui/Formatting.hpp"
#include <ctime>

namespace netneighbor::ui {

static std::string format_local(std::chrono::system_clock::time_point tp, const char* fmt) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm lt{};
  ::localtime_r(&t, &lt);
  char buf[64];
  if (std::strftime(buf, sizeof(buf), fmt, &lt) == 0) return std::string();
  return std::string(buf);
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  return format_local(tp, "%Y-%m-%d %H:%M:%S");
}

std::string format_timestamp_now() {
  return format_timestamp(std::chrono::system_clock::now());
}

std::string format_hour_bucket(std::chrono::system_clock::time_point tp) {
  return format_local(tp, "%Y-%m-%d_%H");
}

} // namespace netneighbor::ui
