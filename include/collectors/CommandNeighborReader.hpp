#pragma once
#include "collectors/INeighborReader.hpp"
#include <string>

namespace netneighbor::collectors {

// Runs both table commands in a single `sh -c` and splits the output on a marker line.
class CommandNeighborReader : public INeighborReader {
public:
  static constexpr const char* kSplitMarker = "===SPLIT===";

  CommandNeighborReader(std::string arp_cmd = "arp -a -n", std::string neigh_cmd = "ip neigh show");

  std::optional<NeighborText> read() override;
  const std::string& last_error() const override { return last_error_; }
  const char* name() const override { return "arp + ip neigh"; }

  [[nodiscard]] std::string script() const;

  // Split combined output; both blocks are empty when the marker is missing.
  [[nodiscard]] static NeighborText split_output(const std::string& combined);

private:
  std::string arp_cmd_;
  std::string neigh_cmd_;
  std::string last_error_;
};

} // namespace netneighbor::collectors
