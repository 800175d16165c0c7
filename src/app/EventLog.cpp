#include "app/EventLog.hpp"
#include "ui/Formatting.hpp"
#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>

namespace netneighbor::app {

EventLog::EventLog(std::filesystem::path log_dir) : log_dir_(std::move(log_dir)) {
  std::error_code ec;
  std::filesystem::create_directories(log_dir_, ec);
  if (ec) {
    std::fprintf(stderr, "netneighbor: EventLog: failed to create %s: %s\n",
                 log_dir_.c_str(), ec.message().c_str());
  }
}

EventLog::~EventLog() {
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool EventLog::append(const netneighbor::model::PresenceEvent& ev,
                      std::chrono::system_clock::time_point when) {
  auto required_path = chunk_path(when);

  // Rotate on hour boundary
  if (required_path != current_path_ || !file_.is_open()) {
    if (file_.is_open()) {
      file_.flush();
      file_.close();
    }
    file_.clear();
    file_.open(required_path, std::ios::app);
    if (!file_) {
      std::fprintf(stderr, "netneighbor: EventLog: failed to open %s: %s\n",
                   required_path.c_str(), std::strerror(errno));
      current_path_.clear();
      return false;
    }
    current_path_ = required_path;
  }

  auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      when.time_since_epoch()).count();
  char ts_buf[32];
  auto res = std::to_chars(ts_buf, ts_buf + sizeof(ts_buf), epoch_ms);

  file_.write(ts_buf, res.ptr - ts_buf);
  file_ << ' ' << netneighbor::model::kind_name(ev.kind)
        << ' ' << ev.device.ip_address
        << ' ' << ev.device.mac_address
        << ' ' << ev.device.interface << '\n';
  file_.flush();
  if (!file_) {
    std::fprintf(stderr, "netneighbor: EventLog: write to %s failed\n", current_path_.c_str());
    file_.close();
    return false;
  }
  return true;
}

std::filesystem::path EventLog::chunk_path(std::chrono::system_clock::time_point when) const {
  return log_dir_ / ("netneighbor_" + netneighbor::ui::format_hour_bucket(when) + ".log");
}

} // namespace netneighbor::app
