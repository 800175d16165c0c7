#pragma once
#include "model/Device.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace netneighbor::collectors {

// Loopback (127.*, ::1) and multicast/broadcast-looking (224.*, 255.*) addresses.
[[nodiscard]] bool is_excluded_address(std::string_view ip);

// Parse `arp -a -n` output, e.g. "? (192.168.1.5) at aa:bb:cc:dd:ee:ff [ether] on wlan0".
// Lines that do not look like a resolution entry are skipped.
[[nodiscard]] auto parse_arp_table(std::string_view text,
                                   const std::optional<std::string>& interface_filter)
    -> netneighbor::model::DeviceSnapshot;

// Parse `ip neigh show` output, e.g. "192.168.1.6 dev eth0 lladdr 11:22:33:44:55:66 REACHABLE".
// Lines without both `dev` and `lladdr` are skipped.
[[nodiscard]] auto parse_ip_neigh_table(std::string_view text,
                                        const std::optional<std::string>& interface_filter)
    -> netneighbor::model::DeviceSnapshot;

} // namespace netneighbor::collectors
