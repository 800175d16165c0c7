#include "collectors/NeighborCollector.hpp"
#include "collectors/NeighborParser.hpp"

namespace netneighbor::collectors {

bool collect_snapshot(INeighborReader& reader,
                      const std::optional<std::string>& interface_filter,
                      netneighbor::model::DeviceSnapshot& out,
                      std::string& err) {
  out.clear();
  auto text = reader.read();
  if (!text) {
    err = reader.last_error();
    return false;
  }
  out = parse_arp_table(text->arp, interface_filter);
  for (auto& [key, dev] : parse_ip_neigh_table(text->neigh, interface_filter)) {
    out.insert_or_assign(key, std::move(dev));
  }
  return true;
}

NeighborCollector::NeighborCollector(std::unique_ptr<INeighborReader> reader,
                                     std::optional<std::string> interface_filter)
    : reader_(std::move(reader)), filter_(std::move(interface_filter)) {}

bool NeighborCollector::sample(netneighbor::model::DeviceSnapshot& out) {
  if (!collect_snapshot(*reader_, filter_, out, last_error_)) return false;
  last_error_.clear();
  return true;
}

} // namespace netneighbor::collectors
