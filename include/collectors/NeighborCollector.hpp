#pragma once
#include "collectors/INeighborReader.hpp"
#include "model/Device.hpp"
#include <memory>
#include <optional>
#include <string>

namespace netneighbor::collectors {

// Read both tables through `reader`, parse and union them (neighbor table wins on equal keys).
// Returns false only when the reader could not be invoked; `err` receives the reason.
[[nodiscard]] bool collect_snapshot(INeighborReader& reader,
                                    const std::optional<std::string>& interface_filter,
                                    netneighbor::model::DeviceSnapshot& out,
                                    std::string& err);

class NeighborCollector {
public:
  NeighborCollector(std::unique_ptr<INeighborReader> reader, std::optional<std::string> interface_filter);

  // Sample current neighbor state into out. Return true on success.
  [[nodiscard]] bool sample(netneighbor::model::DeviceSnapshot& out);

  [[nodiscard]] const std::string& last_error() const { return last_error_; }
  [[nodiscard]] const std::optional<std::string>& interface_filter() const { return filter_; }
  [[nodiscard]] const char* reader_name() const { return reader_->name(); }

private:
  std::unique_ptr<INeighborReader> reader_;
  std::optional<std::string> filter_;
  std::string last_error_;
};

} // namespace netneighbor::collectors
