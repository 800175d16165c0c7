#include "collectors/CommandNeighborReader.hpp"
#include <sys/wait.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace netneighbor::collectors {

CommandNeighborReader::CommandNeighborReader(std::string arp_cmd, std::string neigh_cmd)
    : arp_cmd_(std::move(arp_cmd)), neigh_cmd_(std::move(neigh_cmd)) {}

std::string CommandNeighborReader::script() const {
  return arp_cmd_ + "; echo '" + kSplitMarker + "'; " + neigh_cmd_;
}

NeighborText CommandNeighborReader::split_output(const std::string& combined) {
  NeighborText out;
  auto pos = combined.find(kSplitMarker);
  if (pos == std::string::npos) return out;
  out.arp = combined.substr(0, pos);
  out.neigh = combined.substr(pos + std::strlen(kSplitMarker));
  return out;
}

std::optional<NeighborText> CommandNeighborReader::read() {
  // stderr of the table tools is not captured
  std::string cmd = script();
  FILE* fp = ::popen(cmd.c_str(), "r");
  if (!fp) {
    last_error_ = std::string("popen failed: ") + std::strerror(errno);
    return std::nullopt;
  }
  std::string combined;
  char buf[4096];
  size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), fp)) > 0) combined.append(buf, n);
  int status = ::pclose(fp);
  if (status == -1) {
    last_error_ = std::string("pclose failed: ") + std::strerror(errno);
    return std::nullopt;
  }
  // shell could not run at all
  if (WIFEXITED(status) && WEXITSTATUS(status) == 127 && combined.empty()) {
    last_error_ = "could not execute /bin/sh";
    return std::nullopt;
  }
  last_error_.clear();
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) return NeighborText{};
  return split_output(combined);
}

} // namespace netneighbor::collectors
