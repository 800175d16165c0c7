#pragma once

#include <chrono>
#include <string>

namespace netneighbor::ui {

// Local time as "YYYY-MM-DD HH:MM:SS"
std::string format_timestamp(std::chrono::system_clock::time_point tp);
std::string format_timestamp_now();

// Local hour bucket "YYYY-MM-DD_HH", used for log file rotation
std::string format_hour_bucket(std::chrono::system_clock::time_point tp);

} // namespace netneighbor::ui
