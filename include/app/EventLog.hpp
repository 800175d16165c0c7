#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include "model/Device.hpp"

namespace netneighbor::app {

// Appends presence events to netneighbor_YYYY-MM-DD_HH.log under log_dir, one line each:
// "<epoch_ms> <CONNECTED|DISCONNECTED> <ip> <mac> <interface>"
class EventLog {
public:
  explicit EventLog(std::filesystem::path log_dir);
  ~EventLog();
  EventLog(const EventLog&) = delete;
  EventLog& operator=(const EventLog&) = delete;

  // Returns false if the line could not be written; the error is reported on stderr.
  bool append(const netneighbor::model::PresenceEvent& ev,
              std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

  [[nodiscard]] std::filesystem::path chunk_path(std::chrono::system_clock::time_point when) const;
  [[nodiscard]] const std::filesystem::path& dir() const { return log_dir_; }

private:
  std::filesystem::path log_dir_;
  std::filesystem::path current_path_;
  std::ofstream file_;
};

} // namespace netneighbor::app
