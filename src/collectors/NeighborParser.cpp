#include "collectors/NeighborParser.hpp"
#include <cctype>
#include <vector>

namespace netneighbor::collectors {

static std::vector<std::string_view> split_ws(std::string_view line) {
  std::vector<std::string_view> out;
  size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    size_t st = i;
    while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    if (i > st) out.push_back(line.substr(st, i - st));
  }
  return out;
}

template <typename Fn>
static void for_each_line(std::string_view text, Fn&& fn) {
  size_t start = 0;
  while (start < text.size()) {
    size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos) nl = text.size();
    fn(text.substr(start, nl - start));
    start = nl + 1;
  }
}

bool is_excluded_address(std::string_view ip) {
  return ip.starts_with("127.") || ip.starts_with("224.") || ip.starts_with("255.") || ip == "::1";
}

netneighbor::model::DeviceSnapshot parse_arp_table(std::string_view text,
                                                   const std::optional<std::string>& interface_filter) {
  netneighbor::model::DeviceSnapshot out;
  for_each_line(text, [&](std::string_view line) {
    if (line.find("at") == std::string_view::npos || line.find("on") == std::string_view::npos) return;
    auto tok = split_ws(line);
    if (tok.size() < 7) return;
    std::string_view ip = tok[1];
    while (!ip.empty() && ip.front() == '(') ip.remove_prefix(1);
    while (!ip.empty() && ip.back() == ')') ip.remove_suffix(1);
    std::string_view iface = tok[6];
    if (interface_filter && iface != *interface_filter) return;
    if (is_excluded_address(ip)) return;
    netneighbor::model::upsert(out, {std::string(ip), std::string(tok[3]), std::string(iface)});
  });
  return out;
}

netneighbor::model::DeviceSnapshot parse_ip_neigh_table(std::string_view text,
                                                        const std::optional<std::string>& interface_filter) {
  netneighbor::model::DeviceSnapshot out;
  for_each_line(text, [&](std::string_view line) {
    auto tok = split_ws(line);
    if (tok.size() < 6) return;
    std::string_view ip = tok[0];
    std::optional<std::string_view> mac, iface;
    for (size_t i = 1; i + 1 < tok.size(); ++i) {
      if (tok[i] == "lladdr") mac = tok[i + 1];
      else if (tok[i] == "dev") iface = tok[i + 1];
    }
    // FAILED/INCOMPLETE entries carry no lladdr
    if (!mac || !iface) return;
    if (interface_filter && *iface != *interface_filter) return;
    if (is_excluded_address(ip)) return;
    netneighbor::model::upsert(out, {std::string(ip), std::string(*mac), std::string(*iface)});
  });
  return out;
}

} // namespace netneighbor::collectors
