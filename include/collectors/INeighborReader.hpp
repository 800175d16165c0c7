#pragma once
#include <optional>
#include <string>

namespace netneighbor::collectors {

// Raw neighbor-table text, one block per source utility.
struct NeighborText {
  std::string arp;
  std::string neigh;
};

// Source of raw neighbor state so the collector can be driven by fixtures in tests.
class INeighborReader {
public:
  virtual ~INeighborReader() = default;

  // Return std::nullopt only if the source could not be invoked at all.
  // An empty or failed table read is a valid result with empty blocks.
  [[nodiscard]] virtual std::optional<NeighborText> read() = 0;

  // Reason for the last nullopt from read()
  [[nodiscard]] virtual const std::string& last_error() const = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace netneighbor::collectors
